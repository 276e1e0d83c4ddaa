/**
 * @file  mbean_error_table.h
 *
 * @brief Defines the error codes raised by the mbean library.
 */

#ifndef MBEAN_ERROR_TABLE_H
#define MBEAN_ERROR_TABLE_H

/**
 * @defgroup error_codes mbean ERROR Codes
 * @note ERROR code format:
 *
 *      -mmmnnn
 *
 * Where -mmm000 identifies the error and nnn is free for an embedded
 * errno value reported by a transport.
 *
 * Codes in the 100,000 range describe bad input, the 200,000 range
 * describes connection failures and the 300,000 range describes failures
 * reported by a registry.
 */

#ifdef MAKE_MBEAN_ERROR_MAP
#include <map>
#include <string>
namespace {
    namespace mbean_error_map_construction {
        std::map<const int, const std::string> mbean_error_map;

        int create_error( const std::string& err_name, const int err_code, const int& ) {
            mbean_error_map.insert( std::pair<const int, const std::string>( err_code, err_name ) );
            return err_code;
        }
    }
}
#define NEW_ERROR(err_name, err_code) const int err_name = mbean_error_map_construction::create_error( #err_name, err_code, err_name );
#else
#define NEW_ERROR(err_name, err_code) err_name = err_code,
enum MBEAN_ERROR_ENUM
{
#endif

// clang-format off

/** @defgroup argument_errors Argument ERRORs
 *  @ingroup error_codes
 *  ERROR Code Range 100,000 - 199,000
 * @{
 */
NEW_ERROR(INVALID_ARGUMENT,                 -100000)
NEW_ERROR(MALFORMED_OBJECT_NAME,            -101000)
NEW_ERROR(MALFORMED_SERVICE_URL,            -102000)
NEW_ERROR(KEY_NOT_FOUND,                    -103000)
NEW_ERROR(INVALID_ANY_CAST,                 -104000)
NEW_ERROR(CONFIGURATION_FILE_ERROR,         -105000)
/** @} */

/** @defgroup connection_errors Connection ERRORs
 *  @ingroup error_codes
 *  ERROR Code Range 200,000 - 299,000
 * @{
 */
NEW_ERROR(CONNECT_FAILED,                   -200000)
NEW_ERROR(TRANSPORT_ERROR,                  -201000)
NEW_ERROR(AUTHENTICATION_FAILED,            -202000)
NEW_ERROR(CONNECTOR_PROVIDER_NOT_FOUND,     -203000)
/** @} */

/** @defgroup registry_errors Registry ERRORs
 *  @ingroup error_codes
 *  ERROR Code Range 300,000 - 399,000
 * @{
 */
NEW_ERROR(OPERATION_FAILED,                 -300000)
NEW_ERROR(INSTANCE_NOT_FOUND,               -301000)
NEW_ERROR(INSTANCE_ALREADY_EXISTS,          -302000)
NEW_ERROR(OPERATION_NOT_FOUND,              -303000)
/** @} */

// clang-format on

#ifndef MAKE_MBEAN_ERROR_MAP
}; // enum MBEAN_ERROR_ENUM
#endif

#endif // MBEAN_ERROR_TABLE_H
