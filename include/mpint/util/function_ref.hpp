#ifndef MPINT_FUNCTION_REF_HPP
#define MPINT_FUNCTION_REF_HPP

#include "ulight/function_ref.hpp"

namespace mpint {

template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

} // namespace mpint

#endif
