#include "collab/keyword_retriever.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>
#include "core/text/text_utils.hpp"

namespace taskpilot::collab {

using core::errors::ErrorKind;
using core::errors::TaskError;

namespace {

const std::set<std::string>& stopwords() {
    static const std::set<std::string> kStopwords = {
        "the", "and", "for", "are", "what", "how", "can", "does", "with", "that",
        "this", "from", "into", "about", "our", "your", "any", "there", "which",
        "when", "who", "may", "much", "many", "will", "should", "would", "tell"};
    return kStopwords;
}

std::set<std::string> terms_of(const std::string& text) {
    std::set<std::string> terms;
    std::string token;
    auto flush = [&terms, &token]() {
        if (token.size() >= 3 && stopwords().count(token) == 0) {
            terms.insert(token);
        }
        token.clear();
    };
    for (const char c : core::text::lowercase(text)) {
        if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
            token.push_back(c);
        } else {
            flush();
        }
    }
    flush();
    return terms;
}

}  // namespace

std::vector<PolicyDocument> default_policy_corpus() {
    return {
        {"travel-policy", "Travel reimbursement policy",
         "Business travel expenses are reimbursed when the trip is approved in advance by "
         "the department manager. Economy class is the standard for flights under six "
         "hours. Travel claims must include receipts and be submitted within 30 days of "
         "the trip."},
        {"meal-allowance", "Meal allowance",
         "Meals during business travel are reimbursed up to 150 per day. Client "
         "entertainment meals need the names of attendees. Alcohol is not eligible for "
         "reimbursement."},
        {"accommodation-limits", "Accommodation limits",
         "Hotel accommodation is reimbursed up to 600 per night in tier one cities and 400 "
         "per night elsewhere. Stays above the limit need written approval from finance."},
        {"submission-deadline", "Claim submission deadline",
         "Reimbursement claims must be submitted within 30 days of the expense date. Late "
         "claims are rejected unless the finance director grants an exception."},
        {"approval-process", "Approval process",
         "Each reimbursement claim is approved by the direct manager and then reviewed by "
         "finance. Approved claims are paid with the next monthly payroll. Rejected claims "
         "can be resubmitted once with corrections."},
        {"work-order-process", "Finance work order process",
         "Problems with a reimbursement are raised as a finance work order. Each work order "
         "has one assignee and a priority of low, medium, high or urgent. Open duplicates "
         "should be updated instead of opening a new work order."},
    };
}

KeywordRetriever::KeywordRetriever(std::vector<PolicyDocument> corpus)
    : corpus_(std::move(corpus)) {}

core::errors::Result<std::vector<Passage>> KeywordRetriever::search(
    const std::string& query, const std::size_t top_k, const double similarity_threshold,
    const CallContext& context) {
    if (auto refused = refuse_call(context)) {
        return refused.value();
    }

    const auto query_terms = terms_of(query);
    if (query_terms.empty()) {
        return TaskError{ErrorKind::ParameterInvalid,
                         "The search query has no usable terms.", "empty_search_query",
                         "", "query"};
    }

    std::vector<Passage> passages;
    for (const auto& document : corpus_) {
        const auto document_terms = terms_of(document.title + " " + document.text);
        std::size_t shared = 0;
        for (const auto& term : query_terms) {
            shared += document_terms.count(term);
        }
        const double score =
            static_cast<double>(shared) / static_cast<double>(query_terms.size());
        if (shared > 0 && score >= similarity_threshold) {
            passages.push_back(
                Passage{document.title + ": " + document.text, "doc:" + document.id, score});
        }
    }

    std::stable_sort(passages.begin(), passages.end(),
                     [](const Passage& a, const Passage& b) { return a.score > b.score; });
    if (passages.size() > top_k) {
        passages.resize(top_k);
    }
    return passages;
}

}  // namespace taskpilot::collab
