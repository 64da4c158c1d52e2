/**
 * @page wp-frame wlanpipe Frame Codec
 * @file frame.hpp
 * @brief Fixed-size command/response frames exchanged between a frontend and the broker.
 *
 * @details
 * PURPOSE
 * -------
 * Every datagram on the wlanpipe channel is exactly kFrameSize bytes. This header
 * defines the control codes, the status vocabulary, the payload layout, and the
 * free functions that turn raw bytes into a Frame and back.
 *
 * WIRE LAYOUT
 * -----------
 *   offset  size  field
 *   ------  ----  -------------------------------------------
 *        0     1  control code (ControlCode)
 *        1     3  reserved, zero
 *        4   108  payload, interpreted by control code
 *
 *   STATUS    [4..7]   u32 status, network byte order
 *   SYNC      [4..5]   u16 pairing code, network byte order
 *   CONNECT   [4]      ssid_len (1..32)
 *             [5]      flags, bit0 = BSSID present
 *             [6]      secret_len (0..64)
 *             [7]      reserved
 *             [8..39]  SSID bytes
 *             [40..45] BSSID
 *             [46..47] reserved
 *             [48..111] secret bytes
 *   BIND_ACK, UNBIND, QUIT: payload all zero
 *
 * DESIGN CHOICES
 * --------------
 * - decode() checks only the length. A frame with an unknown control code still
 *   decodes; the broker decides what to do with it.
 * - encode() is total. Any Frame value produces exactly kFrameSize bytes.
 * - Builders are hand-written, one per control code, so it is obvious what goes
 *   on the wire.
 *
 * EXAMPLE
 * -------
 * @code
 *   using namespace wlanpipe;
 *   std::vector<uint8_t> wire = encode(make_status(StatusCode::Success));
 *
 *   Frame f;
 *   if (decode(wire.data(), wire.size(), f) == DecodeStatus::Ok) {
 *     // f.control_code == STATUS, f.status_value() == 0
 *   }
 * @endcode
 */
#ifndef WLANPIPE_FRAME_HPP
#define WLANPIPE_FRAME_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "wlanpipe/wifi/wifi_base.hpp"

namespace wlanpipe {

constexpr std::size_t kFrameSize   = 112;
constexpr std::size_t kHeaderSize  = 4;
constexpr std::size_t kPayloadSize = kFrameSize - kHeaderSize;

// ---- control codes ----
constexpr uint8_t SYNC     = 0x01;
constexpr uint8_t CONNECT  = 0x02;
constexpr uint8_t BIND_ACK = 0x03;   // broker -> frontend only
constexpr uint8_t STATUS   = 0x04;   // broker -> frontend only
constexpr uint8_t UNBIND   = 0x05;
constexpr uint8_t QUIT     = 0x06;

// ---- status vocabulary (u32 on the wire) ----
enum class StatusCode : uint32_t {
  Success            = 0,
  ErrGeneric         = 1,
  ErrNotFound        = 2,
  ErrAssociation     = 3,
  ErrNoLink          = 4,
  ErrNoAddress       = 5,
  ErrInvalidArgument = 6,
};

enum class DecodeStatus : uint8_t { Ok = 0, MalformedFrame = 1 };

// ---- CONNECT payload offsets (absolute, from frame start) ----
constexpr std::size_t kConnSsidLenOff   = 4;
constexpr std::size_t kConnFlagsOff     = 5;
constexpr std::size_t kConnSecretLenOff = 6;
constexpr std::size_t kConnSsidOff      = 8;
constexpr std::size_t kConnBssidOff     = 40;
constexpr std::size_t kConnSecretOff    = 48;
constexpr uint8_t     kConnFlagBssid    = 0x01;

/**
 * @brief One decoded frame: control code plus the raw payload area.
 *
 * Accessors interpret the payload for a given control code. They do not check
 * control_code themselves; callers dispatch first.
 */
struct Frame {
  uint8_t control_code = 0;
  std::array<uint8_t, kPayloadSize> payload{};

  uint32_t status_value() const;
  uint16_t sync_code() const;

  /// Unpack a CONNECT payload. Returns false if the declared lengths are out of range.
  bool connect_target(wifi::TargetNetwork& out) const;
};

/// Any length other than kFrameSize is MalformedFrame; @p out is untouched in that case.
DecodeStatus decode(const uint8_t* data, std::size_t len, Frame& out);

std::vector<uint8_t> encode(const Frame& f);

// ---- builders ----
Frame make_status(StatusCode code);
Frame make_bind_ack();
Frame make_sync(uint16_t code);
Frame make_connect(const wifi::TargetNetwork& target);
Frame make_unbind();
Frame make_quit();

/// "SYNC", "STATUS", ... or "UNKNOWN".
const char* control_name(uint8_t code);
/// "success", "err_not_found", ... or "unknown".
const char* status_name(uint32_t value);

/// One-line key=value rendering, e.g. "code=STATUS status=success".
std::string describe(const Frame& f);

} // namespace wlanpipe

#endif // WLANPIPE_FRAME_HPP
