#pragma once

// every config may be overridden on the compiler command line (see CMakeLists.txt)

#ifndef XJB_CONFIG_SIZEOF_VOID_P
#define XJB_CONFIG_SIZEOF_VOID_P                    (8)
#endif
#ifndef XJB_CONFIG_DEBUG_MODE
#define XJB_CONFIG_DEBUG_MODE                       (1)
#endif

// 0 => strict mode: every Value/WidePtr access checks the tag or descriptor
// 1 => unchecked mode: accessors trust the caller
#ifndef XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
#define XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS      (0)
#endif

// arena block sizing: first block size, and the cap for geometric growth
#ifndef XJB_CONFIG_ARENA_DEFAULT_BLOCK_SIZE
#define XJB_CONFIG_ARENA_DEFAULT_BLOCK_SIZE         (64 << 10)
#endif
#ifndef XJB_CONFIG_ARENA_MAX_BLOCK_SIZE
#define XJB_CONFIG_ARENA_MAX_BLOCK_SIZE             (64 << 20)
#endif
