#pragma once

#include "types.hpp"
#include <chrono>
#include <string>

// One category of raw market data. Implementations make one attempt per call,
// honour the timeout, and report failure as a value instead of throwing.
// fetch() is called repeatedly, but never concurrently with itself.
class SourceClient {
public:
    virtual ~SourceClient() = default;

    virtual const std::string& name() const = 0;
    virtual FetchResult fetch(std::chrono::milliseconds timeout) = 0;
};
