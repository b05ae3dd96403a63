#ifndef ESHARE_ALLOCATOR_HPP
#define ESHARE_ALLOCATOR_HPP

#include <mimalloc.h>
#include <cstddef>
#include <memory_resource>

namespace eshare {

// PMR memory_resource backed by mimalloc (mi_malloc_aligned / mi_free_aligned)
class mi_memory_resource : public std::pmr::memory_resource {
  void *do_allocate(std::size_t bytes, std::size_t alignment) override;
  void do_deallocate(void *p, std::size_t bytes,
                     std::size_t alignment) override;
  bool do_is_equal(const memory_resource &other) const noexcept override;
};

// Install mimalloc as the global default PMR resource.
// Called once from the thread_pool constructor; safe to call again.
void init_allocator();

// Global mimalloc-backed PMR resource (singleton). Replay buffers allocate
// their rings from it.
std::pmr::memory_resource *mi_resource() noexcept;

} // namespace eshare

#endif // ESHARE_ALLOCATOR_HPP
