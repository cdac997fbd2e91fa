/**
 * @file CommandSequenceTagger.hpp
 * @brief Sequence tagger backed by an external program speaking JSON on stdin/stdout.
 */

#pragma once

#include <string>

#include "domain/SequenceTagger.hpp"

namespace refsifter::infrastructure {

/**
 * @class CommandSequenceTagger
 * @brief Runs a labeling command once per candidate under timeout(1).
 *
 * The request JSON is written to a private temp file that becomes the
 * command's stdin; stdout is parsed with TaggerProtocol::ParseLabels.
 */
class CommandSequenceTagger : public domain::SequenceTagger {
public:
    CommandSequenceTagger(const std::string& command, int timeoutMs = 5000);

    std::optional<std::vector<domain::FieldLabel>> tag(const std::vector<domain::TokenFeatureVector>& features) override;
    std::string name() const override { return "command:" + m_command; }

    /** @brief True if the first word of the command resolves via the shell. */
    bool isAvailable() const;

private:
    std::string m_command;
    int m_timeoutMs;
};

} // namespace refsifter::infrastructure
