#pragma once

/*
 * C boundary for embedding host runtimes.
 *
 * Ownership rules:
 *  - <kind>_from_foreign_text borrows the host handle for the duration of the
 *    call and returns an identifier owned by the caller.
 *  - <kind>_to_foreign_text returns a new host text object. The host owns it
 *    and must take it over immediately; it must not be cached on this side.
 *  - Every identifier returned by value must be passed to <kind>_free exactly
 *    once. It must not be used after that.
 *
 * Handles that are dangling or do not hold valid UTF-8 text, double frees and
 * use after free are undefined behaviour. Nothing here checks for them.
 * No entry point unwinds into the host: a C++ exception raised behind one of
 * them (no host installed, out of memory) ends in std::terminate.
 */

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
#define IDMILL_NOEXCEPT noexcept
#else
#define IDMILL_NOEXCEPT
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* Text object owned by the host runtime */
typedef struct idmill_host_text idmill_host_text;

typedef struct idmill_host_api {
    /* Borrow the UTF-8 bytes of a live host text object. The bytes stay valid
     * while the host keeps the object alive. */
    const char* (*borrow_utf8)(idmill_host_text* handle, size_t* length);
    /* Create a new host text object holding a copy of data. */
    idmill_host_text* (*new_text)(const char* data, size_t length);
} idmill_host_api;

/* Installs the host callbacks. Returns 0 and keeps the current table when a
 * callback is missing. Null uninstalls. Not thread safe. */
uint8_t idmill_install_host(const idmill_host_api* api) IDMILL_NOEXCEPT;

/* Owned text buffer, opaque to the host */
typedef struct idmill_text idmill_text;

typedef struct account_id_t {
    idmill_text* value;
} account_id_t;

typedef struct component_id_t {
    idmill_text* value;
} component_id_t;

typedef struct symbol_t {
    idmill_text* value;
} symbol_t;

typedef struct venue_t {
    idmill_text* value;
} venue_t;

account_id_t account_id_from_foreign_text(idmill_host_text* handle) IDMILL_NOEXCEPT;
idmill_host_text* account_id_to_foreign_text(const account_id_t* account_id) IDMILL_NOEXCEPT;
void account_id_free(account_id_t account_id) IDMILL_NOEXCEPT;
account_id_t account_id_clone(const account_id_t* account_id) IDMILL_NOEXCEPT;
uint8_t account_id_eq(const account_id_t* lhs, const account_id_t* rhs) IDMILL_NOEXCEPT;
uint64_t account_id_hash(const account_id_t* account_id) IDMILL_NOEXCEPT;

component_id_t component_id_from_foreign_text(idmill_host_text* handle) IDMILL_NOEXCEPT;
idmill_host_text* component_id_to_foreign_text(const component_id_t* component_id) IDMILL_NOEXCEPT;
void component_id_free(component_id_t component_id) IDMILL_NOEXCEPT;
component_id_t component_id_clone(const component_id_t* component_id) IDMILL_NOEXCEPT;
uint8_t component_id_eq(const component_id_t* lhs, const component_id_t* rhs) IDMILL_NOEXCEPT;
uint64_t component_id_hash(const component_id_t* component_id) IDMILL_NOEXCEPT;

symbol_t symbol_from_foreign_text(idmill_host_text* handle) IDMILL_NOEXCEPT;
idmill_host_text* symbol_to_foreign_text(const symbol_t* symbol) IDMILL_NOEXCEPT;
void symbol_free(symbol_t symbol) IDMILL_NOEXCEPT;
symbol_t symbol_clone(const symbol_t* symbol) IDMILL_NOEXCEPT;
uint8_t symbol_eq(const symbol_t* lhs, const symbol_t* rhs) IDMILL_NOEXCEPT;
uint64_t symbol_hash(const symbol_t* symbol) IDMILL_NOEXCEPT;

venue_t venue_from_foreign_text(idmill_host_text* handle) IDMILL_NOEXCEPT;
idmill_host_text* venue_to_foreign_text(const venue_t* venue) IDMILL_NOEXCEPT;
void venue_free(venue_t venue) IDMILL_NOEXCEPT;
venue_t venue_clone(const venue_t* venue) IDMILL_NOEXCEPT;
uint8_t venue_eq(const venue_t* lhs, const venue_t* rhs) IDMILL_NOEXCEPT;
uint64_t venue_hash(const venue_t* venue) IDMILL_NOEXCEPT;

#ifdef __cplusplus
}
#endif
