#pragma once

#include <QByteArray>
#include <QString>
#include <QVector2D>
#include <QVector3D>
#include <QVector4D>

#include <cstdint>

enum class TextEncoding {
  Utf16Le = 0,
  Utf8 = 1,
};

// Forward-only little-endian reader over an immutable byte buffer.
//
// Every read either succeeds and advances, or fails without advancing and
// records why in fault(). Reads never touch bytes past the end of the buffer.
class BinaryCursor {
public:
  enum class Fault {
    None = 0,
    Truncated,  // Fewer bytes remain than the read requires.
    Malformed,  // The bytes are present but cannot be interpreted.
  };

  BinaryCursor() = default;
  explicit BinaryCursor(const QByteArray* bytes) : bytes_(bytes) {}

  int size() const { return bytes_ ? static_cast<int>(bytes_->size()) : 0; }
  int pos() const { return pos_; }
  int remaining() const { return size() - pos_; }
  bool at_end() const { return pos_ >= size(); }

  Fault fault() const { return fault_; }

  [[nodiscard]] bool can_read(int n) const;
  [[nodiscard]] bool skip(int n);
  [[nodiscard]] bool read_bytes(int n, QByteArray* out);
  // Copies the next n bytes without consuming them.
  [[nodiscard]] bool peek_bytes(int n, QByteArray* out) const;

  [[nodiscard]] bool read_u8(quint8* out);
  [[nodiscard]] bool read_i8(qint8* out);
  [[nodiscard]] bool read_u16(quint16* out);
  [[nodiscard]] bool read_i16(qint16* out);
  [[nodiscard]] bool read_u32(quint32* out);
  [[nodiscard]] bool read_i32(qint32* out);
  [[nodiscard]] bool read_f32(float* out);

  [[nodiscard]] bool read_vec2(QVector2D* out);
  [[nodiscard]] bool read_vec3(QVector3D* out);
  [[nodiscard]] bool read_vec4(QVector4D* out);

  // Signed index of 1, 2 or 4 bytes. The all-ones pattern of each width is -1.
  [[nodiscard]] bool read_indexed(int width, qint64* out);
  // Vertex indices are unsigned for the 1- and 2-byte widths.
  [[nodiscard]] bool read_vertex_index(int width, qint64* out);

  // i32 byte length followed by that many bytes of text.
  [[nodiscard]] bool read_text(TextEncoding encoding, QString* out);

private:
  bool fail(Fault f);
  std::uint32_t load_le(int n) const;

  const QByteArray* bytes_ = nullptr;
  int pos_ = 0;
  Fault fault_ = Fault::None;
};

[[nodiscard]] inline bool is_valid_index_width(int width) {
  return width == 1 || width == 2 || width == 4;
}
