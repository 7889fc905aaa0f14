#pragma once

#include <string>

#include "common/models.hpp"

namespace foldermind {

// Derived per-chunk metadata: token estimate, up to five key phrases (most
// frequent non-stopword bigrams, then words), topics from a fixed keyword
// table, and a Flesch reading-ease score tuned for technical text (30-70).
SemanticMetadata computeSemanticMetadata(const std::string &text);

double readabilityScore(const std::string &text);

} // namespace foldermind
