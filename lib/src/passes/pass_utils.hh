//
// Helpers shared by the pass implementations (not installed)
//

#pragma once

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace typeshape::passes::detail {

/// Pushes onto a stack for the lifetime of the scope
template <typename T>
class scoped_push {
public:
    scoped_push(std::vector<T>& stack, T value)
        : stack_(stack)
    {
        stack_.push_back(std::move(value));
    }

    ~scoped_push() { stack_.pop_back(); }

    scoped_push(const scoped_push&) = delete;
    scoped_push& operator=(const scoped_push&) = delete;

private:
    std::vector<T>& stack_;
};

/// Increments a depth counter for the lifetime of the scope
class scoped_depth {
public:
    explicit scoped_depth(std::size_t& depth)
        : depth_(depth)
    {
        ++depth_;
    }

    ~scoped_depth() { --depth_; }

    scoped_depth(const scoped_depth&) = delete;
    scoped_depth& operator=(const scoped_depth&) = delete;

private:
    std::size_t& depth_;
};

template <typename T>
bool on_stack(const std::vector<T>& stack, const T& value) {
    return std::find(stack.begin(), stack.end(), value) != stack.end();
}

} // namespace typeshape::passes::detail
