// C ABI over thermite::FileEngine
#define THERMITE_IMPLEMENTATION
#include <thermite/engine.hpp>

#include "thermite.h"

static_assert(sizeof(thermite_header_t) == sizeof(thermite::RawHeader));
static_assert(offsetof(thermite_header_t, start) == offsetof(thermite::RawHeader, start));
static_assert(sizeof(thermite_datapoint_t) == sizeof(thermite::RawSample));
static_assert(offsetof(thermite_datapoint_t, value) == offsetof(thermite::RawSample, value));
static_assert(THERMITE_ERROR_SIGNAL_NOT_FOUND == int64_t(thermite::EngineCode::SignalNotFound));
static_assert(THERMITE_ERROR_INVALID_ARGUMENT == int64_t(thermite::EngineCode::InvalidArgument));

extern "C" {

int64_t thermite_header_count(const char* path) {
  if (!path) {
    return THERMITE_ERROR_INVALID_ARGUMENT;
  }
  thermite::FileEngine engine;
  return engine.headerCount(path);
}

int64_t thermite_headers(const char* path, thermite_header_t* out, uint64_t count) {
  if (!path) {
    return THERMITE_ERROR_INVALID_ARGUMENT;
  }
  thermite::FileEngine engine;
  return engine.headers(path, reinterpret_cast<thermite::RawHeader*>(out), count);
}

int64_t thermite_data_count(const char* path, const char* name) {
  if (!path || !name) {
    return THERMITE_ERROR_INVALID_ARGUMENT;
  }
  thermite::FileEngine engine;
  return engine.dataCount(path, name);
}

int64_t thermite_data(const char* path, const char* name, thermite_datapoint_t* out,
                      uint64_t count) {
  if (!path || !name) {
    return THERMITE_ERROR_INVALID_ARGUMENT;
  }
  thermite::FileEngine engine;
  return engine.data(path, name, reinterpret_cast<thermite::RawSample*>(out), count);
}

}  // extern "C"
