/**
 * @file thermite.h
 * @brief C ABI of the thermite engine.
 *
 * Every function takes the path of a thermite file and returns a
 * non-negative count on success or a negative thermite_error_t on failure.
 * The functions keep no state between calls.
 */

#ifndef THERMITE_H
#define THERMITE_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32) || defined(__CYGWIN__)
#ifdef THERMITE_C_BUILDING_DLL
#define THERMITE_API __declspec(dllexport)
#else
#define THERMITE_API __declspec(dllimport)
#endif
#else
#define THERMITE_API __attribute__((visibility("default")))
#endif

#define THERMITE_HEADER_NAME_LENGTH 48

/** @brief Error codes returned by all API functions */
typedef enum thermite_error_t {
    THERMITE_ERROR_OPEN_FAILED = -1,        /**< File could not be opened */
    THERMITE_ERROR_READ_FAILED = -2,        /**< Short or failed read */
    THERMITE_ERROR_MAGIC_MISMATCH = -3,     /**< Not a thermite file */
    THERMITE_ERROR_INVALID_HEADER = -4,     /**< Corrupt header table */
    THERMITE_ERROR_INVALID_DATA_BLOCK = -5, /**< Corrupt data block */
    THERMITE_ERROR_SIGNAL_NOT_FOUND = -6,   /**< No header with the given name */
    THERMITE_ERROR_INVALID_ARGUMENT = -7    /**< NULL path, name or buffer */
} thermite_error_t;

/** @brief Header record; name is NUL-padded and unterminated when all 48 bytes are used */
typedef struct thermite_header_t {
    char name[THERMITE_HEADER_NAME_LENGTH];
    uint64_t start;
} thermite_header_t;

/** @brief Sample record; timestamp is microseconds since the Unix epoch */
typedef struct thermite_datapoint_t {
    int64_t timestamp;
    double value;
} thermite_datapoint_t;

/**
 * @brief Number of header records in the file
 */
THERMITE_API int64_t thermite_header_count(const char *path);

/**
 * @brief Copy up to count header records, in file order, into out
 *
 * @return Number of records written
 */
THERMITE_API int64_t thermite_headers(const char *path, thermite_header_t *out, uint64_t count);

/**
 * @brief Number of samples stored for the named signal
 */
THERMITE_API int64_t thermite_data_count(const char *path, const char *name);

/**
 * @brief Copy up to count samples of the named signal into out
 *
 * @return Number of samples written
 */
THERMITE_API int64_t thermite_data(const char *path, const char *name,
                                   thermite_datapoint_t *out, uint64_t count);

#ifdef __cplusplus
}
#endif

#endif /* THERMITE_H */
