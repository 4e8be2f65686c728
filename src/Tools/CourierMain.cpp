/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Courier project.
 */

#include "CourierApp.h"
#include "../Logging/ConsoleSink.h"
#include "../Logging/Logger.h"

using namespace Courier::Core;

int main(int argc, char* argv[]) {
    auto& logger = Logging::Logger::global();
    logger.clearSinks();
    logger.addSink(std::make_shared<Logging::ConsoleSink>(false));

    return Courier::Tools::runCourier(argc, argv, IO::BackendRegistry::createDefault());
}
