/**
 * @file cdd_entry.h
 * @brief C ABI for functions called in-process by the native executor
 *
 * A contract using `executor: native` names a shared library (`runner.entry`)
 * and a symbol (`runner.symbol`, or a step's `method`). The symbol must have
 * the cdd_entry_fn signature.
 *
 * ## Calling convention
 *
 * 1. `args_json` is the step's `with:` map as a JSON object, never NULL.
 *
 * 2. On success the function returns 0 and may set `out->json` to the JSON
 *    text of its return value. NULL means a null return value. A JSON object
 *    holding an "ok" key is treated as a complete result envelope
 *    ({ok, value, error_code, message, meta}).
 *
 * 3. On failure the function returns non-zero and may set `out->error` to a
 *    description of the fault. The executor reports it as `exception`.
 *
 * 4. Both strings must be allocated with malloc(); the executor frees them.
 *
 * 5. C++ exceptions must not cross this boundary.
 *
 * ## Example
 *
 * ```c
 * #include <cdd/cdd_entry.h>
 * #include <stdlib.h>
 * #include <string.h>
 *
 * CDD_ENTRY int answer(const char* args_json, cdd_call_result* out) {
 *     (void)args_json;
 *     out->json = strdup("42");
 *     return 0;
 * }
 * ```
 */

#ifndef CDD_ENTRY_H
#define CDD_ENTRY_H

#ifdef __cplusplus
extern "C" {
#endif

#define CDD_ENTRY_ABI_VERSION 1

#if defined(_WIN32) || defined(_WIN64)
    #define CDD_ENTRY_EXPORT __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
    #define CDD_ENTRY_EXPORT __attribute__((visibility("default")))
#else
    #define CDD_ENTRY_EXPORT
#endif

#ifdef __cplusplus
    #define CDD_ENTRY extern "C" CDD_ENTRY_EXPORT
#else
    #define CDD_ENTRY CDD_ENTRY_EXPORT
#endif

typedef struct cdd_call_result {
    char* json;   /* malloc'd JSON text of the return value, NULL means null */
    char* error;  /* malloc'd fault text when the call returns non-zero */
} cdd_call_result;

typedef int (*cdd_entry_fn)(const char* args_json, cdd_call_result* out);

#ifdef __cplusplus
}
#endif

#endif /* CDD_ENTRY_H */
