#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Status codes returned by the C API.
 * CUDP_OK is success; negative values name the stage that failed.
 */
enum {
    CUDP_OK                    =  0,
    CUDP_ERR_ARGUMENT          = -1,  /* NULL pointer or bad argument */
    CUDP_ERR_HEADER_TRUNCATED  = -2,  /* Fewer than 8 bytes */
    CUDP_ERR_HEADER_LENGTH     = -3,  /* Length field below 8 */
    CUDP_ERR_HEADER_FIELD      = -4,  /* Port or checksum field unreadable */
    CUDP_ERR_DATA_TRUNCATED    = -5,  /* Payload shorter than declared */
    CUDP_ERR_DATA_TOO_LARGE    = -6,  /* Payload exceeds 65527 octets */
    CUDP_ERR_BUFFER_TOO_SMALL  = -7   /* Output buffer cannot hold result */
};

/**
 * C representation of a parsed UDP header.
 */
struct CUdpHeaderC {
    uint16_t source_port;
    uint16_t destination_port;
    uint16_t length;      /* Total octets, header included */
    uint16_t checksum;    /* 0 = absent */
};

/**
 * C representation of a parsed datagram.
 * `data` points into the caller's input buffer; nothing is copied.
 */
struct CUdpDatagramC {
    struct CUdpHeaderC header;
    const uint8_t* data;
    size_t data_len;
};

/* Platform-specific export macro */
#ifdef _WIN32
  #ifdef CUDP_BUILDING_DLL
    #define CUDP_CAPI __declspec(dllexport)
  #else
    #define CUDP_CAPI
  #endif
#else
  #if defined(CUDP_BUILDING_DLL) && __GNUC__ >= 4
    #define CUDP_CAPI __attribute__((visibility("default")))
  #else
    #define CUDP_CAPI
  #endif
#endif


// ---------------------------------------------------------------------------
// CHECKSUM
// ---------------------------------------------------------------------------
/**
 * One's-complement checksum over pseudo-header, header (checksum field
 * zeroed) and payload. Never returns 0.
 */
CUDP_CAPI uint16_t cudp_checksum_compute(const uint8_t* pseudo, size_t pseudo_len,
                                         const uint8_t* header, size_t header_len,
                                         const uint8_t* data, size_t data_len);

/**
 * Returns 1 if the spans (header carrying its transmitted checksum)
 * fold to all ones, 0 otherwise.
 */
CUDP_CAPI int cudp_checksum_verify(const uint8_t* pseudo, size_t pseudo_len,
                                   const uint8_t* header, size_t header_len,
                                   const uint8_t* data, size_t data_len);


// ---------------------------------------------------------------------------
// PARSING
// ---------------------------------------------------------------------------
CUDP_CAPI int cudp_header_parse(const uint8_t* bytes, size_t len,
                                struct CUdpHeaderC* out);

CUDP_CAPI int cudp_datagram_parse(const uint8_t* bytes, size_t len,
                                  struct CUdpDatagramC* out);


// ---------------------------------------------------------------------------
// BUILDING
// ---------------------------------------------------------------------------
/**
 * Serializes a datagram into `out`.
 *
 * Addresses are host-order IPv4 values (0x7F000001 = 127.0.0.1) and are
 * only used when `with_checksum` is non-zero. On success `*out_len`
 * holds the number of bytes written.
 */
CUDP_CAPI int cudp_datagram_build(uint16_t source_port,
                                  uint16_t destination_port,
                                  const uint8_t* data, size_t data_len,
                                  uint32_t source_addr,
                                  uint32_t destination_addr,
                                  int with_checksum,
                                  uint8_t* out, size_t out_cap,
                                  size_t* out_len);

/**
 * Static description of a status code. Never NULL.
 */
CUDP_CAPI const char* cudp_strerror(int status);

#ifdef __cplusplus
}
#endif
