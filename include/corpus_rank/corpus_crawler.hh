#ifndef __CORPUS_RANK_CORPUS_CRAWLER_HH__
#define __CORPUS_RANK_CORPUS_CRAWLER_HH__

#include "graph.hh"
#include <filesystem>
#include <set>
#include <string>

namespace corpus_rank {

// Targets of every <a href="..."> in html.
std::set<std::string> ExtractLinks(const std::string &html);

// Reads every *.html file in directory. Each file is a page named after the
// file; its links exclude itself and anything outside the corpus.
// Throws CorpusError if the directory or a page cannot be read.
Graph::LinkMap CrawlCorpus(const std::filesystem::path &directory);

// CrawlCorpus followed by Graph::FromLinkMap.
Graph LoadCorpus(const std::filesystem::path &directory);

} // namespace corpus_rank

#endif
