#pragma once

#include <string>
#include <vector>
#include "collab/collaborators.hpp"

namespace taskpilot::collab {

struct PolicyDocument {
    std::string id;
    std::string title;
    std::string text;
};

// Built-in reimbursement policy excerpts used by the CLI and the tests.
std::vector<PolicyDocument> default_policy_corpus();

// Scores documents by the share of query terms they contain.
class KeywordRetriever : public Retriever {
public:
    explicit KeywordRetriever(std::vector<PolicyDocument> corpus);

    core::errors::Result<std::vector<Passage>> search(
        const std::string& query, std::size_t top_k, double similarity_threshold,
        const CallContext& context) override;

private:
    std::vector<PolicyDocument> corpus_;
};

}  // namespace taskpilot::collab
