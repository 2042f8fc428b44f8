#pragma once

#include <stdexcept>
#include <string>

namespace gapfill {

// Invalid startup configuration, or a fallback start that no layout accepts.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The store could not answer a read (prepare, execute or decode failure).
class TransientStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Remote fetch or the write of the fetched rows failed.
class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace gapfill
