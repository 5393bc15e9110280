#include "photo_triage/escalation/escalation.hpp"
#include "photo_triage/core/errors.hpp"
#include "photo_triage/core/utils.hpp"

namespace photo_triage::escalation {

std::string build_consolidated_instruction() {
    return R"(You are a professional photo editor reviewing one frame from a photographer's session.
An automatic sharpness and exposure check could not decide whether this image is worth keeping.

Assess it and answer with ONE JSON object:
- decision: "keep" if the image is technically sound enough to keep, "reject" if it should be culled
- label: a descriptive name of 2-4 words, lowercase, hyphen separated (e.g. "golden-hour-beach-portrait")
- critique: one or two sentences on sharpness, exposure and composition, or null

CRITICAL DISTINCTIONS (avoid false rejects):
- Artistic motion blur vs camera shake blur
- Intentional bokeh/shallow DOF vs misfocus
- Creative underexposure vs technical failure
- High ISO grain (acceptable) vs unsharp blur (reject)
- Intentional vignetting vs lens problems

Respond with ONLY valid JSON. No markdown, no code blocks, no explanation.
Example: {"decision": "keep", "label": "sunset-silhouette-beach", "critique": "Sharp silhouette, strong horizon placement."})";
}

json verdict_json_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"decision", {{"type", "string"}, {"enum", {"keep", "reject"}}}},
            {"label", {{"type", "string"}}},
            {"critique", {{"type", {"string", "null"}}}}
        }},
        {"required", {"decision", "label"}}
    };
}

StructuredVerdict parse_structured_verdict(const std::string& content) {
    std::string text = core::trim(content);

    // tolerate a markdown fence around the object
    if (core::starts_with(text, "```")) {
        const auto first_nl = text.find('\n');
        const auto last_fence = text.rfind("```");
        if (first_nl != std::string::npos && last_fence != std::string::npos && last_fence > first_nl) {
            text = core::trim(text.substr(first_nl + 1, last_fence - first_nl - 1));
        }
    }

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw EscalationMalformedResponse(std::string("content is not JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw EscalationMalformedResponse("content is not a JSON object");
    }

    if (!j.contains("decision") || !j["decision"].is_string()) {
        throw EscalationMalformedResponse("missing decision");
    }
    const std::string decision = core::to_lower(core::trim(j["decision"].get<std::string>()));

    StructuredVerdict v;
    if (decision == "keep") {
        v.decision = Stage2Decision::KEEP;
    } else if (decision == "reject") {
        v.decision = Stage2Decision::REJECT;
    } else {
        throw EscalationMalformedResponse("invalid decision '" + decision + "'");
    }

    if (!j.contains("label") || !j["label"].is_string()) {
        throw EscalationMalformedResponse("missing label");
    }
    v.label = core::slugify(j["label"].get<std::string>());
    if (v.label.empty()) {
        throw EscalationMalformedResponse("empty label");
    }

    if (j.contains("critique") && !j["critique"].is_null()) {
        if (!j["critique"].is_string()) {
            throw EscalationMalformedResponse("critique must be a string or null");
        }
        std::string critique = core::trim(j["critique"].get<std::string>());
        if (!critique.empty()) {
            v.critique = critique;
        }
    }
    return v;
}

EscalationCascade::EscalationCascade(std::shared_ptr<VisionLanguageClient> client, int max_attempts)
    : client_(std::move(client)),
      max_attempts_(max_attempts),
      instruction_(build_consolidated_instruction()) {
    if (!client_) {
        throw ConfigError("escalation cascade needs a client");
    }
    if (max_attempts_ < 1) {
        throw ConfigError("escalation attempts must be >= 1");
    }
}

EscalationOutcome EscalationCascade::escalate(const EscalationContext& ctx) {
    EscalationOutcome outcome;

    for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
        outcome.attempts = attempt;
        try {
            const std::string content = client_->analyze(ctx.image_bytes, instruction_);
            outcome.verdict = parse_structured_verdict(content);
            outcome.error_kind.clear();
            outcome.error_message.clear();
            return outcome;
        } catch (const EscalationError& e) {
            outcome.error_kind = e.kind();
            outcome.error_message = e.what();
        } catch (const std::exception& e) {
            outcome.error_kind = "EscalationError";
            outcome.error_message = e.what();
        }
    }
    return outcome;
}

} // namespace photo_triage::escalation
