#include "corpus_crawler.hh"
#include "errors.hh"
#include "spdlog/spdlog.h"
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace corpus_rank {

namespace {
constexpr std::string_view kAnchorOpen = "<a";
constexpr std::string_view kHrefOpen = "href=\"";

std::string ReadPage(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    throw CorpusError("Failed to open " + path.string());
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return contents.str();
}
} // namespace

std::set<std::string> ExtractLinks(const std::string &html) {
  std::set<std::string> links;
  size_t pos = 0;
  while ((pos = html.find(kAnchorOpen, pos)) != std::string::npos) {
    const size_t attrs = pos + kAnchorOpen.size();
    ++pos;
    if (attrs >= html.size() ||
        !std::isspace(static_cast<unsigned char>(html[attrs]))) {
      continue;
    }

    // href must start inside the tag, its value may run past a '>'
    const size_t tag_end = html.find('>', attrs);
    const size_t href = html.find(kHrefOpen, attrs + 1);
    if (href == std::string::npos || href > tag_end) {
      continue;
    }
    const size_t value_begin = href + kHrefOpen.size();
    const size_t value_end = html.find('"', value_begin);
    if (value_end == std::string::npos) {
      continue;
    }
    links.insert(html.substr(value_begin, value_end - value_begin));
    pos = value_end + 1;
  }
  return links;
}

Graph::LinkMap CrawlCorpus(const std::filesystem::path &directory) {
  std::error_code ec;
  std::filesystem::directory_iterator dir(directory, ec);
  if (ec) {
    throw CorpusError("Failed to read corpus directory " + directory.string() +
                      ": " + ec.message());
  }

  Graph::LinkMap pages;
  for (; dir != std::filesystem::directory_iterator(); dir.increment(ec)) {
    if (ec) {
      break;
    }
    const auto &entry = *dir;
    if (entry.path().extension() != ".html") {
      continue;
    }
    bool is_file = entry.is_regular_file(ec);
    if (ec) {
      throw CorpusError("Failed to stat " + entry.path().string() + ": " +
                        ec.message());
    }
    if (!is_file) {
      continue;
    }
    const std::string name = entry.path().filename().string();
    auto links = ExtractLinks(ReadPage(entry.path()));
    links.erase(name);
    pages.emplace(name, std::move(links));
  }
  if (ec) {
    throw CorpusError("Failed to list corpus directory " + directory.string() +
                      ": " + ec.message());
  }

  // Only keep links to other pages in the corpus
  for (auto &[name, links] : pages) {
    for (auto it = links.begin(); it != links.end();) {
      if (pages.count(*it) == 0) {
        spdlog::debug("Dropping link {} -> {}: not in corpus", name, *it);
        it = links.erase(it);
      } else {
        ++it;
      }
    }
  }

  spdlog::info("Crawled {} pages from {}", pages.size(), directory.string());
  return pages;
}

Graph LoadCorpus(const std::filesystem::path &directory) {
  return Graph::FromLinkMap(CrawlCorpus(directory));
}

} // namespace corpus_rank
