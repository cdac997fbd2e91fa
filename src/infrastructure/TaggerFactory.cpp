#include "infrastructure/TaggerFactory.hpp"

#include <iostream>

#include "infrastructure/CommandSequenceTagger.hpp"
#include "infrastructure/HttpSequenceTagger.hpp"
#include "infrastructure/RuleBasedTagger.hpp"

namespace refsifter::infrastructure {

std::shared_ptr<domain::SequenceTagger> TaggerFactory::Create(const TaggerSettings& settings) {
    if (settings.backend == "http") {
        std::cerr << "[TaggerFactory] Using HTTP tagger at " << settings.host << ":" << settings.port
                  << settings.path << std::endl;
        auto tagger = std::make_shared<HttpSequenceTagger>(settings.host, settings.port, settings.path, settings.timeoutMs);
        if (!tagger->isAlive()) {
            std::cerr << "[TaggerFactory] WARNING: tagging service not reachable at " << settings.host << ":"
                      << settings.port << std::endl;
        }
        return tagger;
    }
    if (settings.backend == "command") {
        auto tagger = std::make_shared<CommandSequenceTagger>(settings.command, settings.timeoutMs);
        if (!tagger->isAvailable()) {
            std::cerr << "[TaggerFactory] WARNING: tagger command not found: " << settings.command << std::endl;
        }
        return tagger;
    }
    if (settings.backend != "rules") {
        std::cerr << "[TaggerFactory] Unknown backend '" << settings.backend << "', using rules" << std::endl;
    }
    return std::make_shared<RuleBasedTagger>();
}

} // namespace refsifter::infrastructure
