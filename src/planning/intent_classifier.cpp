#include "planning/intent_classifier.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"

namespace taskpilot::planning {

using core::time::CalendarDate;
using protocol::EntityBag;
using protocol::EntityKind;
using protocol::Intent;
using protocol::ToolFamily;

namespace {

const std::vector<std::string>& month_words() {
    static const std::vector<std::string> kMonths = {
        "january", "february", "march",     "april",   "may",      "june",
        "july",    "august",   "september", "october", "november", "december"};
    return kMonths;
}

std::optional<int> month_from_word(const std::string& word) {
    const auto& months = month_words();
    for (std::size_t i = 0; i < months.size(); ++i) {
        const bool abbreviation = (word.size() == 3 || word == "sept") &&
                                  months[i].compare(0, word.size(), word) == 0;
        if (word == months[i] || abbreviation) {
            return static_cast<int>(i) + 1;
        }
    }
    return std::nullopt;
}

// Capitalized words that are never part of a person's name.
bool is_name_stopword(const std::string& word) {
    static const std::set<std::string> kStopwords = {
        "the", "my", "me", "i", "a", "an", "this", "that", "last", "next", "all",
        "hr", "it", "finance", "engineering", "sales", "department", "team",
        "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday",
        "q1", "q2", "q3", "q4", "policy", "travel", "meals", "reimbursement"};
    const std::string lowered = core::text::lowercase(word);
    const auto& months = month_words();
    return kStopwords.count(lowered) > 0 ||
           std::find(months.begin(), months.end(), lowered) != months.end();
}

// Drops stopwords from the end; rejects the candidate if it starts with one.
std::optional<std::string> clean_name(const std::string& candidate) {
    std::istringstream stream(candidate);
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    while (!words.empty() && is_name_stopword(words.back())) {
        words.pop_back();
    }
    if (words.empty() || is_name_stopword(words.front())) {
        return std::nullopt;
    }
    std::string name = words.front();
    for (std::size_t i = 1; i < words.size(); ++i) {
        name += " " + words[i];
    }
    return name;
}

void set_range(EntityBag& entities, const CalendarDate& start, const CalendarDate& end) {
    entities[EntityKind::StartDate] = core::time::format_iso_date(start);
    entities[EntityKind::EndDate] = core::time::format_iso_date(end);
}

void set_month_range(EntityBag& entities, const int year, const int first_month,
                     const int last_month) {
    set_range(entities, core::time::first_day_of_month(year, first_month),
              core::time::last_day_of_month(year, last_month));
}

int year_or(const std::string& digits, const int fallback) {
    return digits.empty() ? fallback : std::stoi(digits);
}

void extract_employee(const std::string& text, EntityBag& entities) {
    static const std::regex kEmployeeId(R"(\b[Ee](\d{3,})\b)");
    std::smatch match;
    if (std::regex_search(text, match, kEmployeeId)) {
        entities[EntityKind::EmployeeId] = "E" + match[1].str();
    }

    static const std::regex kPossessive(R"(\b([A-Z][a-z]+(?:\s+[A-Z][a-z]+)?)'s\b)");
    static const std::regex kAfterPreposition(
        R"(\b(?:[Ff]or|[Oo]f|[Aa]bout|[Ee]mployee|[Bb]y)\s+([A-Z][a-z]+(?:\s+[A-Z][a-z]+)?))");
    for (const auto* pattern : {&kPossessive, &kAfterPreposition}) {
        for (std::sregex_iterator it(text.begin(), text.end(), *pattern), end; it != end;
             ++it) {
            if (auto name = clean_name((*it)[1].str())) {
                entities[EntityKind::EmployeeName] = name.value();
                return;
            }
        }
    }
}

void extract_dates(const std::string& normalized, const CalendarDate& today,
                   EntityBag& entities) {
    static const std::regex kFullDate(
        "(\\d{4}(?:[-/.]\\d{1,2}[-/.]\\d{1,2}|\xE5\xB9\xB4\\d{1,2}\xE6\x9C\x88\\d{1,2}"
        "\xE6\x97\xA5))");
    std::vector<std::string> days;
    bool saw_full_date = false;
    for (std::sregex_iterator it(normalized.begin(), normalized.end(), kFullDate), end;
         it != end; ++it) {
        saw_full_date = true;
        if (auto day = core::time::normalize_date((*it)[1].str())) {
            days.push_back(day.value());
        }
    }
    if (saw_full_date) {
        // Unparseable dates leave the range absent.
        if (days.size() >= 2) {
            entities[EntityKind::StartDate] = std::min(days[0], days[1]);
            entities[EntityKind::EndDate] = std::max(days[0], days[1]);
        } else if (days.size() == 1) {
            entities[EntityKind::StartDate] = days[0];
            entities[EntityKind::EndDate] = days[0];
        }
        return;
    }

    std::smatch match;
    static const std::regex kYearMonth(R"(\b(\d{4})-(\d{1,2})\b)");
    if (std::regex_search(normalized, match, kYearMonth)) {
        const int year = std::stoi(match[1].str());
        const int month = std::stoi(match[2].str());
        if (core::time::is_valid(CalendarDate{year, month, 1})) {
            set_month_range(entities, year, month, month);
        }
        return;
    }

    static const std::regex kQuarter(R"(\bq([1-4])(?:\s+(\d{4}))?\b)");
    if (std::regex_search(normalized, match, kQuarter)) {
        const int quarter = std::stoi(match[1].str());
        set_month_range(entities, year_or(match[2].str(), today.year), quarter * 3 - 2,
                        quarter * 3);
        return;
    }

    static const std::regex kHalf(
        R"(\b(first|second) half(?:\s+(?:of\s+)?(\d{4}))?\b)");
    if (std::regex_search(normalized, match, kHalf)) {
        const int year = year_or(match[2].str(), today.year);
        if (match[1].str() == "first") {
            set_month_range(entities, year, 1, 6);
        } else {
            set_month_range(entities, year, 7, 12);
        }
        return;
    }

    static const std::regex kMonthName(
        R"(\b(january|february|march|april|may|june|july|august|september|october|november|december|jan|feb|mar|apr|jun|jul|aug|sept|sep|oct|nov|dec)\b(?:\s+(\d{4}))?)");
    std::vector<std::pair<int, std::string>> months;
    for (std::sregex_iterator it(normalized.begin(), normalized.end(), kMonthName), end;
         it != end; ++it) {
        const std::string word = (*it)[1].str();
        const std::string year = (*it)[2].str();
        // "may" is only a month when a year follows.
        if (word == "may" && year.empty()) {
            continue;
        }
        if (auto month = month_from_word(word)) {
            months.emplace_back(month.value(), year);
        }
    }
    if (!months.empty()) {
        const auto& first = months.front();
        const auto& last = months.size() > 1 ? months[1] : months.front();
        const int last_year = year_or(last.second, year_or(first.second, today.year));
        const int first_year = year_or(first.second, last_year);
        set_range(entities, core::time::first_day_of_month(first_year, first.first),
                  core::time::last_day_of_month(last_year, last.first));
        return;
    }

    if (core::text::contains_phrase(normalized, "this month")) {
        set_month_range(entities, today.year, today.month, today.month);
    } else if (core::text::contains_phrase(normalized, "last month")) {
        const int year = today.month == 1 ? today.year - 1 : today.year;
        const int month = today.month == 1 ? 12 : today.month - 1;
        set_month_range(entities, year, month, month);
    } else if (core::text::contains_phrase(normalized, "this year")) {
        set_month_range(entities, today.year, 1, 12);
    } else if (core::text::contains_phrase(normalized, "last year")) {
        set_month_range(entities, today.year - 1, 1, 12);
    }
}

void extract_recipient(const std::string& text, const std::string& normalized,
                       EntityBag& entities) {
    static const std::regex kEmail(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})");
    std::smatch match;
    if (std::regex_search(text, match, kEmail)) {
        entities[EntityKind::Recipient] = match[0].str();
        return;
    }

    static const std::regex kDepartment(R"(\bto\s+(?:the\s+)?(hr|finance|engineering|sales)\b)");
    if (std::regex_search(normalized, match, kDepartment)) {
        const std::string department = match[1].str();
        entities[EntityKind::Recipient] =
            department == "hr" ? "HR"
                               : core::text::uppercase(department.substr(0, 1)) +
                                     department.substr(1);
        return;
    }

    static const std::regex kPerson(R"(\bto\s+([A-Z][a-z]+(?:\s+[A-Z][a-z]+)?))");
    for (std::sregex_iterator it(text.begin(), text.end(), kPerson), end; it != end; ++it) {
        if (auto name = clean_name((*it)[1].str())) {
            entities[EntityKind::Recipient] = name.value();
            return;
        }
    }
}

void extract_priority(const std::string& normalized, EntityBag& entities) {
    static const std::regex kBefore(R"(\b(low|medium|high|urgent)\s+priority\b)");
    static const std::regex kAfter(R"(\bpriority\s+(?:is\s+)?(low|medium|high|urgent)\b)");
    std::smatch match;
    if (std::regex_search(normalized, match, kBefore) ||
        std::regex_search(normalized, match, kAfter)) {
        entities[EntityKind::Priority] = match[1].str();
    } else if (core::text::contains_phrase(normalized, "urgent")) {
        entities[EntityKind::Priority] = "urgent";
    } else if (core::text::contains_phrase(normalized, "asap")) {
        entities[EntityKind::Priority] = "high";
    }
}

void extract_category(const std::string& normalized, EntityBag& entities) {
    static const std::vector<std::pair<std::string, std::string>> kCategoryWords = {
        {"travel", "travel"},          {"trip", "travel"},
        {"trips", "travel"},           {"flight", "travel"},
        {"flights", "travel"},         {"meal", "meals"},
        {"meals", "meals"},            {"dinner", "meals"},
        {"dinners", "meals"},          {"lunch", "meals"},
        {"lunches", "meals"},          {"hotel", "accommodation"},
        {"hotels", "accommodation"},   {"accommodation", "accommodation"},
        {"lodging", "accommodation"},  {"office", "office"},
        {"transport", "transport"},    {"transportation", "transport"},
        {"taxi", "transport"},         {"taxis", "transport"},
        {"train", "transport"},        {"trains", "transport"}};
    for (const auto& [word, category] : kCategoryWords) {
        if (core::text::contains_phrase(normalized, word)) {
            entities[EntityKind::Category] = category;
            return;
        }
    }
}

bool mentions_self(const std::string& normalized) {
    static const std::regex kFirstPerson(R"(\b(my|me|i|mine|myself)\b)");
    return std::regex_search(normalized, kFirstPerson);
}

std::string describe(const EntityBag& entities) {
    std::string summary;
    for (const auto& [kind, value] : entities) {
        if (kind == EntityKind::Subject) {
            continue;
        }
        summary += (summary.empty() ? "" : ", ") + protocol::to_string(kind) + "=" + value;
    }
    return summary.empty() ? "none" : summary;
}

}  // namespace

IntentClassifier::IntentClassifier(const tools::ToolRegistry& registry,
                                   std::shared_ptr<collab::LanguageModel> model,
                                   ClassifierOptions options)
    : registry_(registry), model_(std::move(model)), options_(std::move(options)) {}

Classification IntentClassifier::classify(const std::string& request_text) const {
    Classification classification;
    classification.normalized_text = core::text::normalize(request_text);
    classification.entities = extract_entities(request_text);

    std::optional<Intent> intent;
    if (model_) {
        intent = classify_with_model(request_text, classification.entities);
    }
    if (intent.has_value()) {
        classification.intent = intent.value();
        classification.source = ClassificationSource::Model;
    } else {
        classification.intent =
            intent_from_families(matched_families(classification.normalized_text));
        classification.source = ClassificationSource::Rules;
    }

    LOG_INFO("Classified request as " + protocol::to_string(classification.intent) +
             (classification.source == ClassificationSource::Model ? " (model)" : " (rules)") +
             "; entities: " + describe(classification.entities));
    return classification;
}

EntityBag IntentClassifier::extract_entities(const std::string& request_text) const {
    EntityBag entities;
    const std::string normalized = core::text::normalize(request_text);

    extract_employee(request_text, entities);
    if (entities.count(EntityKind::EmployeeId) == 0 &&
        entities.count(EntityKind::EmployeeName) == 0 && options_.current_user.has_value() &&
        mentions_self(normalized)) {
        const auto& user = options_.current_user.value();
        if (!user.name.empty()) {
            entities[EntityKind::EmployeeName] = user.name;
        }
        if (!user.employee_id.empty()) {
            entities[EntityKind::EmployeeId] = core::text::uppercase(user.employee_id);
        }
    }

    extract_dates(normalized, options_.reference_date, entities);
    extract_recipient(request_text, normalized, entities);
    extract_priority(normalized, entities);
    extract_category(normalized, entities);

    const std::string subject = core::text::trim(request_text);
    if (!subject.empty()) {
        entities[EntityKind::Subject] = subject;
    }
    return entities;
}

std::set<ToolFamily> IntentClassifier::matched_families(
    const std::string& normalized_text) const {
    std::set<ToolFamily> families;
    for (const auto* spec : registry_.all()) {
        for (const auto& cue : spec->cues) {
            if (core::text::contains_phrase(normalized_text, cue)) {
                families.insert(spec->family);
                break;
            }
        }
    }
    return families;
}

Intent IntentClassifier::intent_from_families(const std::set<ToolFamily>& families) const {
    if (families.size() != 1) {
        return Intent::CompositeTask;
    }
    switch (*families.begin()) {
        case ToolFamily::Rule:
            return Intent::SimpleLookup;
        case ToolFamily::Record:
            return Intent::DataQuery;
        case ToolFamily::Generation:
            return Intent::ContentGeneration;
        default:
            return Intent::CompositeTask;
    }
}

std::optional<Intent> IntentClassifier::classify_with_model(const std::string& request_text,
                                                            EntityBag& entities) const {
    protocol::PromptContext prompt;
    prompt.purpose = protocol::PromptPurpose::Classify;
    prompt.messages.push_back(
        {protocol::Role::System,
         "Classify the finance request. Reply with one JSON object: {\"intent\": "
         "\"simple_lookup\" | \"data_query\" | \"composite_task\" | "
         "\"content_generation\", \"entities\": {\"employee_name\", \"employee_id\", "
         "\"start_date\", \"end_date\", \"recipient\", \"priority\", \"category\"}}. "
         "Dates use YYYY-MM-DD."});
    std::string user_message = "Request: " + request_text;
    if (options_.current_user.has_value()) {
        user_message += "\nCurrent user: " + options_.current_user->name + " (" +
                        options_.current_user->employee_id + ")";
    }
    prompt.messages.push_back({protocol::Role::User, user_message});

    collab::CallContext context;
    context.timeout = options_.model_timeout;
    context.deadline = std::chrono::steady_clock::now() + options_.model_timeout;

    auto reply = model_->generate(prompt, context);
    if (core::errors::is_error(reply)) {
        LOG_INFO("Model classification unavailable (" + core::errors::get_error(reply).code +
                 "); using rules");
        return std::nullopt;
    }

    const std::string& text = core::errors::get_value(reply);
    const auto open = text.find('{');
    const auto close = text.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        LOG_WARN("Model classification reply has no JSON object; using rules");
        return std::nullopt;
    }
    const auto parsed = nlohmann::json::parse(text.substr(open, close - open + 1), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("intent") ||
        !parsed.at("intent").is_string()) {
        LOG_WARN("Model classification reply is malformed; using rules");
        return std::nullopt;
    }
    const auto intent = protocol::intent_from_string(
        core::text::lowercase(core::text::trim(parsed.at("intent").get<std::string>())));
    if (!intent.has_value()) {
        LOG_WARN("Model returned an unknown intent; using rules");
        return std::nullopt;
    }

    if (parsed.contains("entities") && parsed.at("entities").is_object()) {
        for (const auto& [key, value] : parsed.at("entities").items()) {
            const auto kind = protocol::entity_kind_from_string(key);
            if (!kind.has_value() || !value.is_string() || entities.count(kind.value()) > 0) {
                continue;
            }
            std::string entity = core::text::trim(value.get<std::string>());
            if (kind == EntityKind::StartDate || kind == EntityKind::EndDate) {
                auto day = core::time::normalize_date(entity);
                if (!day.has_value()) {
                    continue;
                }
                entity = day.value();
            } else if (kind == EntityKind::EmployeeId) {
                entity = core::text::uppercase(entity);
            }
            if (!entity.empty()) {
                entities[kind.value()] = entity;
            }
        }
    }
    return intent;
}

}  // namespace taskpilot::planning
