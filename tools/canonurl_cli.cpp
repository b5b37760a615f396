#include <canonurl/canonurl.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

static void usage(const char* argv0) {
  std::cerr
      << "usage:\n"
      << "  " << argv0 << " [--legacy-platform] normalize <url>...\n"
      << "  " << argv0 << " [--legacy-platform] match <url1> <url2>   (exit 0 = match, 1 = differ)\n"
      << "  " << argv0 << " [--legacy-platform] platform <url>...\n"
      << "  " << argv0 << " [--legacy-platform] explain <url>\n"
      << "  " << argv0 << " [--legacy-platform] dedup          (urls on stdin, one per line)\n"
      << "  " << argv0 << " version\n";
}

int main(int argc, char** argv) {
  int argi = 1;
  canonurl::Options opt;
  if (argi < argc && std::string(argv[argi]) == "--legacy-platform") {
    opt.platform_matching = canonurl::HostMatching::kSubstring;
    ++argi;
  }
  if (argi >= argc) { usage(argv[0]); return 2; }

  const std::string cmd = argv[argi++];
  const canonurl::Normalizer normalizer(opt);

  if (cmd == "normalize") {
    if (argi >= argc) { usage(argv[0]); return 2; }
    for (; argi < argc; ++argi) {
      std::cout << normalizer.Normalize(argv[argi]) << "\n";
    }
    return 0;
  } else if (cmd == "match") {
    if (argc - argi != 2) { usage(argv[0]); return 2; }
    const bool equal = normalizer.Match(argv[argi], argv[argi + 1]);
    std::cout << (equal ? "match" : "differ") << "\n";
    return equal ? 0 : 1;
  } else if (cmd == "platform") {
    if (argi >= argc) { usage(argv[0]); return 2; }
    for (; argi < argc; ++argi) {
      std::cout << normalizer.GetPlatform(argv[argi]) << "\n";
    }
    return 0;
  } else if (cmd == "explain") {
    if (argc - argi != 1) { usage(argv[0]); return 2; }
    auto r = normalizer.Explain(argv[argi]);
    std::cout << "canonical=" << r.canonical << "\n"
              << "platform=" << canonurl::PlatformName(r.platform) << "\n"
              << "label=" << normalizer.GetPlatform(argv[argi]) << "\n"
              << "tier=" << canonurl::TierName(r.tier) << "\n"
              << "params_removed=" << r.params_removed << "\n";
    return 0;
  } else if (cmd == "dedup") {
    if (argi != argc) { usage(argv[0]); return 2; }

    // canonical -> index into groups, in first-seen order
    std::unordered_map<std::string, size_t> index;
    std::vector<std::pair<std::string, uint64_t>> groups;

    std::string line;
    while (std::getline(std::cin, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (line.empty()) continue;

      std::string canonical = normalizer.Normalize(line);
      auto it = index.find(canonical);
      if (it == index.end()) {
        index.emplace(std::move(canonical), groups.size());
        groups.emplace_back(line, 0);
      } else {
        groups[it->second].second++;
      }
    }

    for (const auto& g : groups) {
      std::cout << g.first << "\t" << g.second << "\n";
    }
    return 0;
  } else if (cmd == "version") {
    std::cout << canonurl::Version() << "\n";
    return 0;
  }

  usage(argv[0]);
  return 2;
}
