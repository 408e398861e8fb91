#pragma once

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "runbox_logs.h"

namespace runbox::po {

using strvec = std::vector<std::string>;

constexpr auto _size_inf = std::numeric_limits<std::size_t>::max();

class OptionError : public std::exception {
  public:
    explicit OptionError(std::string msg) : msg_(std::move(msg)) {}
    const char *what() const noexcept override { return msg_.c_str(); }

  private:
    std::string msg_;
};
// a required option or a queried value is missing
class ArgNotFound : public OptionError {
    using OptionError::OptionError;
};
// wrong number of values, or a value of the wrong form
class InvalidArg : public OptionError {
    using OptionError::OptionError;
};
// an option or command nobody registered
class NotExist : public OptionError {
    using OptionError::OptionError;
};

template <typename T>
concept my_number = requires(T num) {
    std::from_chars(std::declval<const char *>(), std::declval<const char *>(), num);
};

template <my_number T>
inline T to_int(std::string_view s) {
    T ret;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), ret);
    if (ec == std::errc{} && ptr == s.data() + s.size()) return ret;
    throw InvalidArg("`" + std::string(s) + "` is not a number");
}

// Options look like `-x value`, `-xvalue`, `--name value` or `--name=value`;
// options taking no value never consume the next token. Everything else is
// positional.
class Parser {
  public:
    Parser() = default;
    Parser(const Parser &) = delete;
    Parser(Parser &&) noexcept = default;
    Parser &operator=(const Parser &) = delete;
    Parser &operator=(Parser &&) noexcept = default;

    // `name` must be unique; `short_name` may be 0
    void add(std::string_view name, char short_name, std::string_view description, bool optional,
             std::size_t min_arg, std::size_t max_arg) {
        options_.push_back(option_t{std::string(name), short_name, std::string(description),
                                    optional, min_arg, max_arg});
        values_.emplace_back();
    }

    // Positional arguments accepted, in [min, max]
    void set_positional(std::string_view placeholder, std::size_t min_cnt, std::size_t max_cnt) {
        positional_name_ = std::string(placeholder);
        positional_min_ = min_cnt;
        positional_max_ = max_cnt;
    }

    void set_name(std::string_view name, std::string_view desc) {
        name_str_ = std::string(name);
        desc_str_ = std::string(desc);
    }

    template <typename T>
    T get(std::string_view, const std::optional<T> & = std::nullopt) = delete;
    template <my_number T>
    T get(std::string_view name, const std::optional<T> &default_value = std::nullopt) {
        const auto *v = single_value(name);
        if (v == nullptr) return value_or_throw(name, default_value);
        return to_int<T>(*v);
    }

    const strvec &positional() const { return positional_; }

    void print_usage(std::ostream &os) const {
        os << "Usage: " << name_str_ << " [options]";
        if (!positional_name_.empty()) os << " " << positional_name_;
        os << "\n";
        if (!desc_str_.empty()) os << desc_str_ << "\n";
        if (options_.empty()) return;
        os << "Options:\n";
        for (const auto &opt : options_) {
            auto head = opt.short_name ? fmt::format(RUNBOX_FMT("-{}, --{}"), opt.short_name,
                                                     opt.name)
                                       : fmt::format(RUNBOX_FMT("    --{}"), opt.name);
            if (opt.max_cnt > 0) head += " <arg>";
            os << fmt::format(RUNBOX_FMT("  {:<24} {}"), head, opt.desc) << "\n";
        }
    }

    [[noreturn]] void show_usage() const {
        print_usage(std::cerr);
        std::exit(1);
    }

    void parse_check(int argc, char **argv) { parse_check(strvec(argv, argv + argc)); }

    // argvec[0] is the program or command name
    void parse_check(const strvec &argvec) {
        const auto first = argvec.empty() ? argvec.end() : argvec.begin() + 1;
        if (std::any_of(first, std::find(first, argvec.end(), "--"),
                        [](const std::string &a) { return a == "--help" || a == "-h"; })) {
            show_usage();
        }
        std::ranges::fill(values_, std::nullopt);
        positional_.clear();

        for (std::size_t i = 1; i < argvec.size(); i++) {
            const std::string_view arg = argvec[i];
            if (arg == "--") {
                positional_.insert(positional_.end(), argvec.begin() + i + 1, argvec.end());
                break;
            }
            if (arg.size() < 2 || arg[0] != '-') {
                positional_.emplace_back(arg);
                continue;
            }

            std::size_t idx;
            std::optional<std::string_view> inline_value;
            if (arg[1] == '-') {
                const auto eq = arg.find('=');
                idx = index_of(arg.substr(2, eq == arg.npos ? arg.npos : eq - 2));
                if (eq != arg.npos) inline_value = arg.substr(eq + 1);
            } else {
                idx = index_of(arg[1]);
                if (arg.size() > 2) inline_value = arg.substr(2);
            }

            auto &vals = values_[idx];
            if (!vals) vals.emplace();
            if (inline_value) {
                vals->emplace_back(*inline_value);
            } else if (options_[idx].max_cnt > 0 && i + 1 < argvec.size() &&
                       !argvec[i + 1].starts_with('-')) {
                vals->push_back(argvec[++i]);
            }
        }
        validate();
    }

  private:
    struct option_t {
        std::string name;
        char short_name;
        std::string desc;
        bool optional;
        std::size_t min_cnt, max_cnt;
    };

    std::string name_str_, desc_str_;
    std::vector<option_t> options_;
    // values_[i] is set once options_[i] appeared on the command line
    std::vector<std::optional<strvec>> values_;
    std::string positional_name_;
    std::size_t positional_min_ = 0, positional_max_ = 0;
    strvec positional_;

    std::size_t index_of(std::string_view name) const {
        auto it = std::ranges::find(options_, name, &option_t::name);
        if (it == options_.end()) throw NotExist("no such argument: --" + std::string(name));
        return static_cast<std::size_t>(it - options_.begin());
    }
    std::size_t index_of(char short_name) const {
        auto it = std::ranges::find(options_, short_name, &option_t::short_name);
        if (it == options_.end()) throw NotExist(std::string("no such argument: -") + short_name);
        return static_cast<std::size_t>(it - options_.begin());
    }

    void validate() const {
        for (std::size_t i = 0; i < options_.size(); i++) {
            const auto &opt = options_[i];
            if (!values_[i]) {
                if (!opt.optional) throw ArgNotFound("missing argument `" + opt.name + "`");
                continue;
            }
            const auto n = values_[i]->size();
            if (n < opt.min_cnt || n > opt.max_cnt) {
                throw InvalidArg(fmt::format(
                        RUNBOX_FMT("invalid number of argument for {}, expect [{},{}], got {}"),
                        opt.name, opt.min_cnt, opt.max_cnt, n));
            }
        }
        const auto n = positional_.size();
        if (n >= positional_min_ && n <= positional_max_) return;
        if (positional_max_ == 0) {
            throw InvalidArg("unexpected token `" + positional_.front() + "`");
        }
        throw InvalidArg(fmt::format(RUNBOX_FMT("expected [{},{}] {}, got {}"), positional_min_,
                                     positional_max_, positional_name_, n));
    }

    // nullptr if the option was not given
    const strvec *values_of(std::string_view name) const {
        const auto &v = values_[index_of(name)];
        return v ? &*v : nullptr;
    }
    const std::string *single_value(std::string_view name) const {
        const auto *v = values_of(name);
        if (v == nullptr) return nullptr;
        if (v->size() != 1) {
            throw InvalidArg(fmt::format(RUNBOX_FMT("expected 1 argument for {}, got {}"), name,
                                         v->size()));
        }
        return &v->front();
    }
    template <typename T>
    static T value_or_throw(std::string_view name, const std::optional<T> &default_value) {
        if (default_value) return *default_value;
        throw ArgNotFound("not found: " + std::string(name));
    }
};

// whether the option was given at all
template <>
inline bool Parser::get<bool>(std::string_view name, const std::optional<bool> &) {
    return values_of(name) != nullptr;
}

template <>
inline std::string Parser::get<std::string>(std::string_view name,
                                            const std::optional<std::string> &default_value) {
    const auto *v = single_value(name);
    return v ? *v : value_or_throw(name, default_value);
}

// every value given for the option
template <>
inline strvec Parser::get<strvec>(std::string_view name,
                                  const std::optional<strvec> &default_value) {
    const auto *v = values_of(name);
    return v ? *v : value_or_throw(name, default_value);
}

class CommandBase {
  public:
    virtual ~CommandBase() = default;
    virtual std::string_view get_name() = 0;
    virtual std::string_view get_desc() = 0;
    virtual void init_parser() = 0;
    virtual int run() = 0;
    Parser parser;
};

// Dispatches `<program> <command> [options]` to the registered command
class CommandHandler {
  public:
    void set_name(std::string_view name) { name_str_ = std::string(name); }

    void add_command(std::unique_ptr<CommandBase> cmd) {
        cmd->init_parser();
        cmd->parser.set_name(fmt::format(RUNBOX_FMT("{} {}"), name_str_, cmd->get_name()),
                             cmd->get_desc());
        commands_.push_back(std::move(cmd));
    }

    [[noreturn]] void show_usage() const {
        std::cerr << "Usage: " << name_str_ << " <command> [options]\nCommands:\n";
        for (const auto &cmd : commands_) {
            std::cerr << fmt::format(RUNBOX_FMT("  {:<10} {}"), cmd->get_name(), cmd->get_desc())
                      << "\n";
        }
        std::exit(1);
    }

    // Returns the command name and its exit code
    std::pair<std::string, int> parse(int argc, char **argv) {
        if (argc <= 1) show_usage();
        const std::string_view name = argv[1];
        if (name == "--help" || name == "-h" || name == "help") show_usage();
        auto it = std::ranges::find_if(commands_,
                                       [&](const auto &c) { return c->get_name() == name; });
        if (it == commands_.end()) throw NotExist("unknown command `" + std::string(name) + "`");
        (*it)->parser.parse_check(argc - 1, argv + 1);
        return {std::string(name), (*it)->run()};
    }

  private:
    std::string name_str_;
    std::vector<std::unique_ptr<CommandBase>> commands_;
};

}  // namespace runbox::po
