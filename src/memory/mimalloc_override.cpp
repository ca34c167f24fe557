// Routes global new/delete through mimalloc, so chunk and block buffers allocated outside
// memory::vector share its heaps. Compiled into the library only with USE_MIMALLOC.
#if defined(USE_MIMALLOC)
#include <mimalloc-new-delete.h>
#endif
