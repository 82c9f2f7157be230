#pragma once

#include "aged_cache/types.hpp"

#include <cstddef>
#include <string>

namespace aged_cache {

bool load_options(const std::string &path, CacheOptions &out,
                  std::string *err = nullptr);

std::string render_info(const CacheStats &stats, const CacheOptions &opts,
                        const std::string &time_source,
                        std::size_t entries_linked);

} // namespace aged_cache
