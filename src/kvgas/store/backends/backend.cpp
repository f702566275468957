#include <kvgas/store/backends/backend.hpp>

namespace kvgas::store::backends {

bool abstract_backend::empty() const
{
  return size() == 0;
}

} // namespace kvgas::store::backends
