#pragma once

#include "toolgate/logging/logger_registry.h"

// Per-file logger. Define TOOLGATE_LOG_COMPONENT before including this
// header, e.g. #define TOOLGATE_LOG_COMPONENT "gateway.broadcaster"
#ifdef TOOLGATE_LOG_DISABLE
#define TOOLGATE_LOG(level, ...) ((void)0)
#else
#define TOOLGATE_LOG(level, ...)                                          \
  do {                                                                    \
    if (::toolgate::logging::LoggerRegistry::instance().shouldLog(        \
            TOOLGATE_LOG_COMPONENT,                                       \
            ::toolgate::logging::LogLevel::level)) {                      \
      ::toolgate::logging::LoggerRegistry::instance()                     \
          .getOrCreateLogger(TOOLGATE_LOG_COMPONENT)                      \
          ->log(::toolgate::logging::LogLevel::level, __FILE__, __LINE__, \
                __FUNCTION__, __VA_ARGS__);                               \
    }                                                                     \
  } while (0)
#endif

#ifndef TOOLGATE_LOG_COMPONENT
#define TOOLGATE_LOG_COMPONENT "default"
#endif

// Logging with correlation ids
#define TOOLGATE_LOG_WITH_CONTEXT(level, context, ...)                      \
  do {                                                                      \
    auto logger =                                                           \
        ::toolgate::logging::LoggerRegistry::instance().getOrCreateLogger(  \
            TOOLGATE_LOG_COMPONENT);                                        \
    if (logger->shouldLog(::toolgate::logging::LogLevel::level)) {          \
      logger->logWithContext(::toolgate::logging::LogLevel::level, context, \
                             __VA_ARGS__);                                  \
    }                                                                       \
  } while (0)
