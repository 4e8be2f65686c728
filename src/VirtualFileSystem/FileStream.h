#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include "FileOperationHandle.h"

namespace Courier::Core::IO {

// Result structure for I/O operations
struct IoResult {
    size_t bytesTransferred = 0;
    bool complete = false;
    std::optional<FileError> error;

    bool success() const { return !error.has_value(); }
};

// Pure interface for sequential file streaming
class FileStream {
public:
    virtual ~FileStream() = default;

    // Read into buffer; bytesTransferred == 0 with no error means end of stream
    virtual IoResult read(std::span<std::byte> buffer) = 0;

    // Write data, returns actual bytes written
    virtual IoResult write(std::span<const std::byte> data) = 0;

    virtual bool good() const = 0;
    virtual bool eof() const = 0;
    virtual bool fail() const = 0;

    virtual void flush() = 0;

    // Close the stream (called automatically by destructor). Writers publish their data here;
    // check fail() afterwards.
    virtual void close() = 0;

    virtual std::string path() const { return ""; }
};

} // namespace Courier::Core::IO
