#include "formats/binary_cursor.h"

#include <cstring>

bool BinaryCursor::fail(Fault f) {
  fault_ = f;
  return false;
}

std::uint32_t BinaryCursor::load_le(int n) const {
  std::uint32_t u = 0;
  for (int i = 0; i < n; ++i) {
    const std::uint32_t b = static_cast<quint8>((*bytes_)[pos_ + i]);
    u |= b << (8 * i);
  }
  return u;
}

bool BinaryCursor::can_read(int n) const {
  if (!bytes_ || n < 0) {
    return false;
  }
  return pos_ >= 0 && n <= size() - pos_;
}

bool BinaryCursor::skip(int n) {
  if (n < 0) {
    return fail(Fault::Malformed);
  }
  if (!can_read(n)) {
    return fail(Fault::Truncated);
  }
  pos_ += n;
  return true;
}

bool BinaryCursor::read_bytes(int n, QByteArray* out) {
  if (!peek_bytes(n, out)) {
    return fail(n < 0 ? Fault::Malformed : Fault::Truncated);
  }
  pos_ += n;
  return true;
}

bool BinaryCursor::peek_bytes(int n, QByteArray* out) const {
  if (!can_read(n)) {
    return false;
  }
  if (out) {
    *out = bytes_->mid(pos_, n);
  }
  return true;
}

bool BinaryCursor::read_u8(quint8* out) {
  if (!can_read(1)) {
    return fail(Fault::Truncated);
  }
  if (out) {
    *out = static_cast<quint8>(load_le(1));
  }
  ++pos_;
  return true;
}

bool BinaryCursor::read_i8(qint8* out) {
  quint8 u = 0;
  if (!read_u8(&u)) {
    return false;
  }
  if (out) {
    *out = static_cast<qint8>(u);
  }
  return true;
}

bool BinaryCursor::read_u16(quint16* out) {
  if (!can_read(2)) {
    return fail(Fault::Truncated);
  }
  if (out) {
    *out = static_cast<quint16>(load_le(2));
  }
  pos_ += 2;
  return true;
}

bool BinaryCursor::read_i16(qint16* out) {
  quint16 u = 0;
  if (!read_u16(&u)) {
    return false;
  }
  if (out) {
    *out = static_cast<qint16>(u);
  }
  return true;
}

bool BinaryCursor::read_u32(quint32* out) {
  if (!can_read(4)) {
    return fail(Fault::Truncated);
  }
  if (out) {
    *out = static_cast<quint32>(load_le(4));
  }
  pos_ += 4;
  return true;
}

bool BinaryCursor::read_i32(qint32* out) {
  quint32 u = 0;
  if (!read_u32(&u)) {
    return false;
  }
  if (out) {
    *out = static_cast<qint32>(u);
  }
  return true;
}

bool BinaryCursor::read_f32(float* out) {
  quint32 u = 0;
  if (!read_u32(&u)) {
    return false;
  }
  static_assert(sizeof(float) == sizeof(quint32));
  float f = 0.0f;
  memcpy(&f, &u, sizeof(float));
  if (out) {
    *out = f;
  }
  return true;
}

bool BinaryCursor::read_vec2(QVector2D* out) {
  if (!can_read(8)) {
    return fail(Fault::Truncated);
  }
  float x = 0.0f, y = 0.0f;
  if (!read_f32(&x) || !read_f32(&y)) {
    return false;
  }
  if (out) {
    *out = QVector2D(x, y);
  }
  return true;
}

bool BinaryCursor::read_vec3(QVector3D* out) {
  if (!can_read(12)) {
    return fail(Fault::Truncated);
  }
  float x = 0.0f, y = 0.0f, z = 0.0f;
  if (!read_f32(&x) || !read_f32(&y) || !read_f32(&z)) {
    return false;
  }
  if (out) {
    *out = QVector3D(x, y, z);
  }
  return true;
}

bool BinaryCursor::read_vec4(QVector4D* out) {
  if (!can_read(16)) {
    return fail(Fault::Truncated);
  }
  float x = 0.0f, y = 0.0f, z = 0.0f, w = 0.0f;
  if (!read_f32(&x) || !read_f32(&y) || !read_f32(&z) || !read_f32(&w)) {
    return false;
  }
  if (out) {
    *out = QVector4D(x, y, z, w);
  }
  return true;
}

bool BinaryCursor::read_indexed(int width, qint64* out) {
  qint64 v = 0;
  switch (width) {
    case 1: {
      qint8 i = 0;
      if (!read_i8(&i)) {
        return false;
      }
      v = i;
      break;
    }
    case 2: {
      qint16 i = 0;
      if (!read_i16(&i)) {
        return false;
      }
      v = i;
      break;
    }
    case 4: {
      qint32 i = 0;
      if (!read_i32(&i)) {
        return false;
      }
      v = i;
      break;
    }
    default:
      return fail(Fault::Malformed);
  }
  if (out) {
    *out = v;
  }
  return true;
}

bool BinaryCursor::read_vertex_index(int width, qint64* out) {
  qint64 v = 0;
  switch (width) {
    case 1: {
      quint8 u = 0;
      if (!read_u8(&u)) {
        return false;
      }
      v = u;
      break;
    }
    case 2: {
      quint16 u = 0;
      if (!read_u16(&u)) {
        return false;
      }
      v = u;
      break;
    }
    case 4: {
      qint32 i = 0;
      if (!read_i32(&i)) {
        return false;
      }
      v = i;
      break;
    }
    default:
      return fail(Fault::Malformed);
  }
  if (out) {
    *out = v;
  }
  return true;
}

bool BinaryCursor::read_text(TextEncoding encoding, QString* out) {
  const int start = pos_;
  qint32 length = 0;
  if (!read_i32(&length)) {
    return false;
  }
  if (length < 0) {
    pos_ = start;
    return fail(Fault::Malformed);
  }
  if (!can_read(length)) {
    pos_ = start;
    return fail(Fault::Truncated);
  }
  if (encoding == TextEncoding::Utf16Le && (length % 2) != 0) {
    pos_ = start;
    return fail(Fault::Malformed);
  }

  if (out) {
    const char* base = bytes_->constData() + pos_;
    if (encoding == TextEncoding::Utf8) {
      *out = QString::fromUtf8(base, length);
    } else {
      const int units = length / 2;
      QString s;
      s.resize(units);
      for (int i = 0; i < units; ++i) {
        const quint8 lo = static_cast<quint8>(base[i * 2 + 0]);
        const quint8 hi = static_cast<quint8>(base[i * 2 + 1]);
        s[i] = QChar(static_cast<char16_t>(lo | (hi << 8)));
      }
      *out = s;
    }
  }
  pos_ += length;
  return true;
}
