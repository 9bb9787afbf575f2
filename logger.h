#ifndef QBM_APIDOC_LOGGER_H_
#define QBM_APIDOC_LOGGER_H_

#include <qb/io.h> // This should include nanolog.h if QB_LOGGER is defined

// Define a common prefix for all qbm-apidoc logs to easily identify them.
#define APIDOC_LOG_PREFIX "[qbm-apidoc] "

#ifdef QB_LOGGER

#define LOG_APIDOC_TRACE(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::DEBUG) && \
           NANO_LOG(nanolog::LogLevel::DEBUG) << APIDOC_LOG_PREFIX << "TRACE: " << X)

#define LOG_APIDOC_DEBUG(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::DEBUG) && \
           NANO_LOG(nanolog::LogLevel::DEBUG) << APIDOC_LOG_PREFIX << "DEBUG: " << X)

#define LOG_APIDOC_INFO(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::INFO) && \
           NANO_LOG(nanolog::LogLevel::INFO) << APIDOC_LOG_PREFIX << "INFO: " << X)

#define LOG_APIDOC_WARN(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::WARN) && \
           NANO_LOG(nanolog::LogLevel::WARN) << APIDOC_LOG_PREFIX << "WARN: " << X)

#define LOG_APIDOC_ERROR(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::CRIT) && \
           NANO_LOG(nanolog::LogLevel::CRIT) << APIDOC_LOG_PREFIX << "ERROR: " << X) // Map ERROR to CRIT for higher visibility

#else // QB_LOGGER not defined, fallback to QB_STDOUT_LOG or no-op

#ifdef QB_STDOUT_LOG
#define LOG_APIDOC_TRACE(X) qb::io::cout() << APIDOC_LOG_PREFIX << "TRACE: " << X << std::endl
#define LOG_APIDOC_DEBUG(X) qb::io::cout() << APIDOC_LOG_PREFIX << "DEBUG: " << X << std::endl
#define LOG_APIDOC_INFO(X)  qb::io::cout() << APIDOC_LOG_PREFIX << "INFO: " << X << std::endl
#define LOG_APIDOC_WARN(X)  qb::io::cout() << APIDOC_LOG_PREFIX << "WARN: " << X << std::endl
#define LOG_APIDOC_ERROR(X) qb::io::cerr() << APIDOC_LOG_PREFIX << "ERROR: " << X << std::endl

#else // QB_STDOUT_LOG not defined, logs are no-ops

#define LOG_APIDOC_TRACE(X) do {} while (false)
#define LOG_APIDOC_DEBUG(X) do {} while (false)
#define LOG_APIDOC_INFO(X)  do {} while (false)
#define LOG_APIDOC_WARN(X)  do {} while (false)
#define LOG_APIDOC_ERROR(X) do {} while (false)

#endif // QB_STDOUT_LOG
#endif // QB_LOGGER

#endif // QBM_APIDOC_LOGGER_H_
