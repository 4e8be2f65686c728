#include "Courier.h"
#include <format>

using namespace Courier::Core;
using namespace Courier::Core::Logging;
using namespace Courier::Core::Concurrency;

int main() {
    Logger::global().setMinLevel(LogLevel::Info);

    WorkService service{WorkService::Config()};
    service.start();
    WorkContractGroup group(64, "WorkContractExample");
    PermitPool permits(4);

    // More contracts than slots: drain on this thread when the group is full
    for (int i = 0; i < 256; i++) {
        auto work = [i, &permits]() {
            auto permit = permits.acquire();
            COURIER_LOG_DEBUG_CAT("WorkContractExample", std::format("Executing contract {}", i));
        };
        auto h = group.createContract(work);
        while (!h.valid()) {
            if (group.executeAllBackgroundWork() == 0) group.waitForCapacity();
            h = group.createContract(work);
        }
        h.schedule();

        if (i == 0) {
            service.addWorkContractGroup(&group);
        }
    }

    group.executeAllBackgroundWork();
    group.wait();
    COURIER_LOG_INFO_CAT("WorkContractExample",
        std::format("All work complete, {} permits free of {}", permits.available(), permits.capacity()));

    service.removeWorkContractGroup(&group);
    service.stop();
    return 0;
}
