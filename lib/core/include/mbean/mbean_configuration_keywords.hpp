#ifndef MBEAN_CONFIGURATION_KEYWORDS_HPP
#define MBEAN_CONFIGURATION_KEYWORDS_HPP

namespace mbean
{
    // mbean_environment.json keywords
    extern const char* const KW_CFG_MBEAN_HOST;
    extern const char* const KW_CFG_MBEAN_PORT;
    extern const char* const KW_CFG_MBEAN_LOGIN;
    extern const char* const KW_CFG_MBEAN_PASSWORD;
    extern const char* const KW_CFG_MBEAN_ENVIRONMENT_FILE;
    extern const char* const KW_CFG_MBEAN_LOG_LEVEL;
} // namespace mbean

#endif // MBEAN_CONFIGURATION_KEYWORDS_HPP
