#pragma once

#include <stdexcept>
#include <string>

/// Base class for every per-image conversion failure
class ConversionError : public std::runtime_error {
public:
    explicit ConversionError(const std::string& what) : std::runtime_error(what) {}
};

/// Source rows are not packed as width * 4 bytes
class UnsupportedLayoutError : public ConversionError {
public:
    explicit UnsupportedLayoutError(const std::string& what) : ConversionError(what) {}
};

/// A block (or the whole source) has no pixels to average
class DegenerateBlockError : public ConversionError {
public:
    explicit DegenerateBlockError(const std::string& what) : ConversionError(what) {}
};

/// A block reaches outside the source grid
class OutOfBoundsError : public ConversionError {
public:
    explicit OutOfBoundsError(const std::string& what) : ConversionError(what) {}
};

/// Decoding or encoding an image file failed
class ImageIoError : public ConversionError {
public:
    explicit ImageIoError(const std::string& what) : ConversionError(what) {}
};
