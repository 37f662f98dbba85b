#pragma once

#include <stdexcept>
#include <string>

namespace FRLGRender {

// Load failures abort the whole pipeline; nothing below the command layer catches these.
class AssetError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// File missing or unreadable.
class IoError : public AssetError {
public:
    using AssetError::AssetError;
};

// Size misalignment, header mismatch, unexpected image format.
class FormatError : public AssetError {
public:
    using AssetError::AssetError;
};

// Index outside a table or atlas, raised only for direct-caller contract breaches.
class RangeError : public AssetError {
public:
    using AssetError::AssetError;
};

} // namespace FRLGRender
