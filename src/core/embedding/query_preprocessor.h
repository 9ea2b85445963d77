#pragma once

#include <QString>

#include <utility>
#include <vector>

namespace pl {

// QueryPreprocessor -- deterministic lexical expansion applied to a question
// before it is embedded.
//
// The question is lower-cased, each expansion key found as a whole word is
// replaced by "key expansion" (entries applied in table order, later entries
// see text inserted by earlier ones), and a fixed set of policy boilerplate
// terms is appended.
class QueryPreprocessor {
public:
    using Expansion = std::pair<QString, QString>;

    static QString preprocess(const QString& question);

    static const std::vector<Expansion>& expansions();
    static QString boilerplateTerms();
};

} // namespace pl
