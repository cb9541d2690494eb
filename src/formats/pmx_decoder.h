#pragma once

#include <QByteArray>

#include <optional>

#include "formats/import_error.h"
#include "formats/pmx_document.h"

// Largest element count accepted for any section before allocation.
constexpr qint32 kPmxMaxSectionCount = 16 * 1024 * 1024;

// True when the buffer starts with the PMX signature.
[[nodiscard]] bool looks_like_pmx(const QByteArray& bytes);

// Decodes a complete PMX 2.0/2.1 buffer. Pure: no I/O, no logging, no scene access.
[[nodiscard]] std::optional<PmxDocument> decode_pmx(const QByteArray& bytes, ImportError* error = nullptr);
