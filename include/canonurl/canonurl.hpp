#pragma once

// Single entry point for library users.
//
//   #include <canonurl/canonurl.hpp>
//
//   canonurl::NormalizeUrl("https://www.youtube.com/watch?t=30&v=abc");
//     -> "youtube.com/watch?v=abc"
//   canonurl::UrlsMatch("https://x.com/a/status/1?s=20",
//                       "https://twitter.com/a/status/1");   -> true
//   canonurl::GetPlatform("https://youtu.be/abc");          -> "youtube"

#include <canonurl/domain.hpp>
#include <canonurl/metrics.hpp>
#include <canonurl/normalizer.hpp>
#include <canonurl/query.hpp>
#include <canonurl/version.hpp>
