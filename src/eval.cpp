// Statement resolution with memoization.

#include <algorithm>
#include <cstddef>
#include <format>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "debug.hpp"
#include "pale.hpp"

namespace {

    struct eval_depth {
    private:
        inline static thread_local size_t depth_{0};
        inline static thread_local size_t max_depth_{0};
    public:
        struct guard {
            guard()
            {
                ++depth_;
                max_depth_ = std::max(max_depth_, depth_);
            }
            ~guard() { --depth_; }
            guard(const guard&) = delete;
            guard& operator=(const guard&) = delete;
        };

        static size_t depth() { return depth_; }
        static size_t max_depth() { return max_depth_; }
        static void reset_max() { max_depth_ = depth_; }
        static std::string indent() { return std::string(depth() * 2, ' '); }
    };

} // anonymous namespace

void eval_reset_max_depth() { eval_depth::reset_max(); }
size_t eval_get_max_depth() { return eval_depth::max_depth(); }

statement::statement(var op, std::vector<var> args, location loc)
    : args_(std::move(args)), op_(std::move(op)), loc_(std::move(loc))
{
    if (not op_->is_func()) {
        throw internal_error(std::format("Statement at {} has a {} as its operator",
            loc_.to_string(), value_type_string(op_.get())));
    }
}

var statement::resolve() const
{
    if (result_) {
        if (PALE_DEBUG_ENABLED(memo)) {
            PALE_DEBUG(memo, "{}Reusing result of statement at {}: {}",
                eval_depth::indent(), loc_.to_string(), describe(result_->get()));
        }
        return result_->new_ref();
    }

    eval_depth::guard g;
    const callable& fn = op_->as_func();
    PALE_DEBUG(eval, "{}[{}] Resolving statement at {}: {} with {} argument(s)",
        eval_depth::indent(),
        eval_depth::depth(),
        loc_.to_string(),
        fn.debug_info(),
        args_.size());

    var result = fn.call(args_, loc_);
    result_ = result.new_ref();

    if (PALE_DEBUG_ENABLED(eval)) {
        PALE_DEBUG(eval, "{}[{}] Result: {}",
            eval_depth::indent(),
            eval_depth::depth(),
            describe(result.get()));
    }
    return result;
}

void statement::forget() const
{
    if (result_) {
        PALE_DEBUG(memo, "Forgetting result of statement at {}", loc_.to_string());
    }
    result_.reset();
    for (const auto& arg : args_) {
        if (auto* s = std::get_if<statement>(&arg->data)) {
            s->forget();
        }
    }
}

var var::resolve() const
{
    if (auto* s = std::get_if<statement>(&cell->data)) {
        return s->resolve();
    }
    if (auto* a = std::get_if<alias>(&cell->data)) {
        // Hold the target in case the alias is overwritten while resolving.
        var target = a->target;
        return target.resolve();
    }
    return new_ref();
}
