//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

LogLevel Logger::sLogLevel = Logger::levelFromEnvironment();
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
