#include "builtin_tools.hpp"
#include "../errors.hpp"
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace arena {

namespace {

// Recursive descent over: + - * / % and ^ / ** (right associative),
// unary minus, parentheses. Unary minus binds looser than power: -2^2 = -4.
class ExpressionParser {
public:
    explicit ExpressionParser(const std::string& text) : s_(text) {}

    double parse() {
        double v = parse_sum();
        skip_ws();
        if (pos_ != s_.size()) fail("unexpected '" + std::string(1, s_[pos_]) + "'");
        return v;
    }

private:
    static constexpr int kMaxDepth = 256;

    const std::string& s_;
    size_t pos_ = 0;
    int depth_ = 0;

    struct DepthGuard {
        ExpressionParser& p;
        explicit DepthGuard(ExpressionParser& parser) : p(parser) {
            if (++p.depth_ > kMaxDepth) {
                --p.depth_;
                p.fail("expression nested too deeply");
            }
        }
        ~DepthGuard() { --p.depth_; }
    };

    [[noreturn]] void fail(const std::string& why) {
        throw ToolExecutionError("Calculation error: " + why);
    }

    void skip_ws() {
        while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) pos_++;
    }

    bool eat(char c) {
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == c) { pos_++; return true; }
        return false;
    }

    bool eat_power() {
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == '^') { pos_++; return true; }
        if (pos_ + 1 < s_.size() && s_[pos_] == '*' && s_[pos_ + 1] == '*') { pos_ += 2; return true; }
        return false;
    }

    bool peek_power() {
        skip_ws();
        return pos_ + 1 < s_.size() && s_[pos_] == '*' && s_[pos_ + 1] == '*';
    }

    double parse_sum() {
        double v = parse_product();
        for (;;) {
            if (eat('+')) v += parse_product();
            else if (eat('-')) v -= parse_product();
            else return v;
        }
    }

    double parse_product() {
        double v = parse_unary();
        for (;;) {
            if (peek_power()) return v;
            if (eat('*')) {
                v *= parse_unary();
            } else if (eat('/')) {
                double d = parse_unary();
                if (d == 0.0) fail("division by zero");
                v /= d;
            } else if (eat('%')) {
                double d = parse_unary();
                if (d == 0.0) fail("modulo by zero");
                // Python semantics: result takes the sign of the divisor
                double r = std::fmod(v, d);
                if (r != 0.0 && ((r < 0) != (d < 0))) r += d;
                v = r;
            } else {
                return v;
            }
        }
    }

    double parse_unary() {
        DepthGuard guard(*this);
        if (eat('-')) return -parse_unary();
        if (eat('+')) return parse_unary();
        return parse_power();
    }

    double parse_power() {
        double base = parse_primary();
        if (eat_power()) {
            double exp = parse_unary();
            double v = std::pow(base, exp);
            if (std::isnan(v)) fail("invalid power");
            return v;
        }
        return base;
    }

    double parse_primary() {
        skip_ws();
        if (eat('(')) {
            DepthGuard guard(*this);
            double v = parse_sum();
            if (!eat(')')) fail("missing ')'");
            return v;
        }
        size_t start = pos_;
        while (pos_ < s_.size() &&
               (std::isdigit(static_cast<unsigned char>(s_[pos_])) || s_[pos_] == '.')) {
            pos_++;
        }
        if (start == pos_) {
            if (pos_ >= s_.size()) fail("unexpected end of expression");
            fail("unexpected '" + std::string(1, s_[pos_]) + "'");
        }
        std::string num = s_.substr(start, pos_ - start);
        try {
            size_t used = 0;
            double v = std::stod(num, &used);
            if (used != num.size()) fail("malformed number '" + num + "'");
            return v;
        } catch (const std::logic_error&) {
            fail("malformed number '" + num + "'");
        }
    }
};

} // namespace

double evaluate_expression(const std::string& expression) {
    if (expression.empty()) throw ToolExecutionError("Calculation error: empty expression");
    return ExpressionParser(expression).parse();
}

std::string format_number(double value) {
    if (std::isfinite(value) && std::fabs(value) < 1e15 && value == std::floor(value)) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream ss;
    ss << std::setprecision(12) << value;
    return ss.str();
}

ToolPtr make_calculator_tool() {
    ToolDef def;
    def.name = "calculator";
    def.description = "Perform mathematical calculations";
    def.parameters = nlohmann::json::parse(R"JSON({
        "type": "object",
        "properties": {
            "expression": {"type": "string", "description": "mathematical expression"}
        },
        "required": ["expression"]
    })JSON");

    def.func = [](const nlohmann::json& args) -> std::string {
        std::string expr;
        if (args.is_string()) {
            expr = args.get<std::string>();
        } else if (args.is_object()) {
            expr = args.value("expression", args.value("input", ""));
        }
        return format_number(evaluate_expression(expr));
    };
    return std::make_shared<FunctionTool>(std::move(def));
}

} // namespace arena
