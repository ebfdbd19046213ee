#include "dag/errors.hh"

namespace dag
{
duplicate_key_error::duplicate_key_error(const std::string &key)
    : error(fmt::format("{} already in graph", key))
{
}

unknown_key_error::unknown_key_error(const std::string &key)
    : error(fmt::format("{} not present in graph", key))
{
}

duplicate_element_error::duplicate_element_error(const std::string &elm)
    : error(fmt::format("stack requires unique elements, {} is already "
			"present",
			elm))
{
}

empty_stack_error::empty_stack_error(const std::string &op)
    : error(fmt::format("{} on an empty stack", op))
{
}

stack_overflow_error::stack_overflow_error(size_t max_depth)
    : error(fmt::format("depth-first walk exceeded the maximum depth of {}",
			max_depth)),
      max_depth_(max_depth)
{
}
} // namespace dag
