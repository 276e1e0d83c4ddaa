#include "mbean/mbean_configuration_keywords.hpp"

namespace mbean
{
    // mbean_environment.json keywords
    const char* const KW_CFG_MBEAN_HOST{"mbean_host"};
    const char* const KW_CFG_MBEAN_PORT{"mbean_port"};
    const char* const KW_CFG_MBEAN_LOGIN{"mbean_login"};
    const char* const KW_CFG_MBEAN_PASSWORD{"mbean_password"};
    const char* const KW_CFG_MBEAN_ENVIRONMENT_FILE{"mbean_environment_file"};
    const char* const KW_CFG_MBEAN_LOG_LEVEL{"mbean_log_level"};
} // namespace mbean
