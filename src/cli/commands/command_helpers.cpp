#include "command_helpers.hpp"
#include "../theme.hpp"
#include <managers/result_extractor.hpp>
#include <util/string_utils.hpp>
#include <iostream>
#include <json/json.h>

std::optional<std::string> CommandArgs::get(const std::string& key) const {
    auto it = options.find(key);
    if (it == options.end()) return std::nullopt;
    return it->second;
}

Result<CommandArgs> parse_command_args(const std::string& arg,
                                       const std::set<std::string>& switch_names) {
    auto words = StringUtils::split_args(arg);
    if (!words) {
        return Result<CommandArgs>::Err("Unterminated quote in arguments");
    }

    CommandArgs out;
    const auto& w = *words;
    for (size_t i = 0; i < w.size(); i++) {
        if (w[i].size() > 2 && w[i].rfind("--", 0) == 0) {
            std::string name = w[i].substr(2);
            if (switch_names.count(name)) {
                out.switches.insert(name);
                continue;
            }
            if (i + 1 >= w.size()) {
                return Result<CommandArgs>::Err("Missing value for --" + name);
            }
            out.options[name] = w[++i];
        } else {
            out.positional.push_back(w[i]);
        }
    }
    return Result<CommandArgs>::Ok(std::move(out));
}

void print_reply(const std::string& reply, bool is_record) {
    if (!is_record) {
        std::cout << reply;
        if (!reply.empty() && reply.back() != '\n') std::cout << "\n";
        return;
    }

    auto value = parse_json(reply);
    if (!value) {
        std::cout << reply << "\n";
        return;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    writer["emitUTF8"] = true;
    std::string pretty = Json::writeString(writer, *value);

    std::cout << "\n";
    size_t start = 0;
    while (start < pretty.size()) {
        auto nl = pretty.find('\n', start);
        if (nl == std::string::npos) nl = pretty.size();
        std::cout << "    " << pretty.substr(start, nl - start) << "\n";
        start = nl + 1;
    }
    std::cout << "\n";
}

std::string render_stepper(const ProgressState& state) {
    std::string out = "    ";
    for (int step = STEP_PLAN; step <= STEP_PREVIEW; step++) {
        if (step > STEP_PLAN) out += theme::dim(" \xe2\x94\x80\xe2\x94\x80 ");

        std::string label = step_name(step);
        if (step < state.step) {
            out += theme::green("\xe2\x97\x8f " + label);
        } else if (step == state.step) {
            switch (state.status) {
                case ProgressStatus::Active:    out += theme::yellow("\xe2\x97\x90 " + label); break;
                case ProgressStatus::Completed: out += theme::green("\xe2\x97\x8f " + label); break;
                case ProgressStatus::Failed:    out += theme::red("x " + label); break;
                case ProgressStatus::Idle:      out += theme::dim("\xe2\x97\x8b " + label); break;
            }
        } else {
            out += theme::dim("\xe2\x97\x8b " + label);
        }
    }
    return out + "\n";
}
