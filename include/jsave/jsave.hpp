#pragma once
/// @file jsave.hpp
/// @brief Umbrella header: synchronized values persisted as JSON files
///
/// Three store types share one contract (init / initWith / acquire / save):
/// - Mutex: one holder at a time
/// - RwLock: many readers or one writer; save() takes the write side
/// - ReentrantMutex: the owning thread may acquire again without blocking
///
/// @code
/// std::error_code ec;
/// auto store = JSave::Mutex<std::map<std::string, int>>::initWith({}, "data.json", ec);
/// if (!store) { /* ec says why */ }
/// store->lock()->emplace("foo", 114514);
/// store->save(ec);
/// @endcode

#include "Error.hpp"
#include "Options.hpp"
#include "codec/JsonCodec.hpp"
#include "sync/AutoSaveGuard.hpp"
#include "sync/Guard.hpp"
#include "sync/Mutex.hpp"
#include "sync/ReentrantMutex.hpp"
#include "sync/RwLock.hpp"
#include "util/Log.hpp"
