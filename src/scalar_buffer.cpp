#include "scalar_buffer.h"

namespace unicsv {

void ScalarBuffer::prepend(std::u32string_view scalars) {
    scalars_.insert(scalars_.begin(), scalars.begin(), scalars.end());
}

void ScalarBuffer::append(std::u32string_view scalars) {
    scalars_.insert(scalars_.end(), scalars.begin(), scalars.end());
}

}  // namespace unicsv
