#ifndef QCPACK_H
#define QCPACK_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ── library lifecycle ───────────────────────────────────────────── */

/* Initialize / destroy the underlying PDF library. Call once per process. */
void qcpack_init(void);
void qcpack_destroy(void);

/* ── status codes ────────────────────────────────────────────────── */

enum {
    QCPACK_OK                      =  0,
    QCPACK_ERR_BAD_INPUT           = -1,
    QCPACK_ERR_HEADER_NOT_FOUND    = -2,
    QCPACK_ERR_UNSUPPORTED_DIALECT = -3,
    QCPACK_ERR_BAD_REPORT          = -4,
    QCPACK_ERR_BAD_PDF             = -5,
    QCPACK_ERR_BAD_CONFIG          = -6
};

/* ── callbacks ───────────────────────────────────────────────────── */

/* Receives one JSON object per diagnostic. Return value is ignored. */
typedef int (*qcpack_diag_callback)(const char* json, void* user_data);

/*
 * AI-assisted phrase matching fallback.
 * Returns a verbatim substring of page_text, or NULL for no suggestion.
 * The returned string must stay valid until the next call.
 */
typedef const char* (*qcpack_suggest_callback)(const char* page_text,
                                               const char* phrase,
                                               void* user_data);

/* ── format detection ────────────────────────────────────────────── */

/* Returns "xlsx" or "csv" based on magic bytes. */
const char* qcpack_detect(const void* buf, size_t len);

/* ── struct types ────────────────────────────────────────────────── */

typedef struct {
    const char* id;
    int         page;          /* as stated in the report, pre-offset */
    const char* context;       /* searchable context phrase */
    const char* note;          /* formatted note */
    const char* track;         /* "" if none */
    const char* timestamp;     /* "" if none */
    const char* type;          /* "misread", "missing" or "inserted" */
    int         word_count;    /* number of emphasis words */
} qcpack_correction;

/* ── session ─────────────────────────────────────────────────────── */
/*
 * A session holds options, the corrections of one report and the last
 * generated pack.
 *
 * qcpack_open: config_json may be NULL for defaults. Returns NULL on a
 *              malformed configuration; qcpack_last_error(NULL) then
 *              holds the reason.
 */

typedef struct qcpack_session qcpack_session;

qcpack_session* qcpack_open(const char* config_json);

void qcpack_set_diag_callback(qcpack_session* s, qcpack_diag_callback cb,
                              void* user_data);
void qcpack_set_suggest_callback(qcpack_session* s, qcpack_suggest_callback cb,
                                 void* user_data);

/* Parse a CSV or XLSX report. Returns the number of corrections or a
   negative status code. Resets the correction iterator. */
int qcpack_load_report(qcpack_session* s, const void* buf, size_t len);

/* correction iterator */
const qcpack_correction* qcpack_next_correction(qcpack_session* s);
const char*              qcpack_next_correction_json(qcpack_session* s);

/* Build the annotated pack from the script PDF. Returns the included page
   count or a negative status code. */
int qcpack_build_pack(qcpack_session* s, const void* pdf, size_t len);

/* Bytes of the last generated pack; valid until the next build or close. */
const unsigned char* qcpack_pack_bytes(qcpack_session* s, size_t* len);

/* Message for the last failure, "" if none. */
const char* qcpack_last_error(qcpack_session* s);

/* Effective options as JSON. */
const char* qcpack_options_json(qcpack_session* s);

void qcpack_close(qcpack_session* s);

#ifdef __cplusplus
}
#endif

#endif
