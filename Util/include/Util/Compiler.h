
#ifndef COMPILER_H_
#define COMPILER_H_

#if defined(__GNUC__)
#define REGVM_COLD_CODE __attribute__((noinline, cold))
#define REGVM_FORCE_INLINE __attribute__((always_inline)) inline
#elif defined(_MSC_VER)
#define REGVM_COLD_CODE
#define REGVM_FORCE_INLINE __forceinline
#else
#define REGVM_COLD_CODE
#define REGVM_FORCE_INLINE inline
#endif

#endif
