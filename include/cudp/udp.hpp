#pragma once

/**
 * cudp: RFC 768 (UDP) datagram codec.
 *
 * Value types:
 *   - Port, Length, Checksum    2-octet header fields
 *   - Header                    the 8-octet UDP header
 *   - Datagram                  header + payload
 *   - PseudoHeader, Ipv4Address checksum input from the IP layer
 *
 * Every parse/create returns cudp::Result<T, Error>; nothing throws on
 * malformed input and nothing performs I/O.
 */
#include "cudp/constants.hpp"
#include "cudp/result.hpp"
#include "cudp/ip.hpp"
#include "cudp/checksum.hpp"
#include "cudp/port.hpp"
#include "cudp/length.hpp"
#include "cudp/pseudo_header.hpp"
#include "cudp/header.hpp"
#include "cudp/datagram.hpp"
