// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#ifndef _PRIV_RISCV_H_
#define _PRIV_RISCV_H_

#include <stddef.h>
#include <stdint.h>

#define csr_read(csr)                                                          \
	({                                                                         \
		size_t val;                                                            \
		__asm __volatile("csrr %0, " #csr : "=r"(val));                        \
		val;                                                                   \
	})

#define csr_write(csr, val)                                                    \
	({ __asm __volatile("csrw " #csr ", %0" ::"r"(val)); })

#define csr_set(csr, val)                                                      \
	({ __asm __volatile("csrs " #csr ", %0" ::"r"(val)); })

#define csr_clear(csr, val)                                                    \
	({ __asm __volatile("csrc " #csr ", %0" ::"r"(val)); })

namespace priv
{
	constexpr size_t MSTATUS_UIE = (1 << 0);
	constexpr size_t MSTATUS_SIE = (1 << 1);
	constexpr size_t MSTATUS_HIE = (1 << 2);
	constexpr size_t MSTATUS_MIE = (1 << 3);
	constexpr size_t MSTATUS_AIE =
	  (MSTATUS_UIE | MSTATUS_SIE | MSTATUS_HIE | MSTATUS_MIE);

	/**
	 * Disable all interrupt-enable bits in `mstatus` and return the ones that
	 * were previously set, for use with `intr_restore`.
	 */
	static inline size_t intr_disable(void)
	{
		size_t ret;

		__asm volatile("csrrci %0, mstatus, %1"
		               : "=&r"(ret)
		               : "i"(MSTATUS_AIE)
		               : "memory");

		return (ret & (MSTATUS_AIE));
	}

	static inline void intr_restore(size_t s)
	{
		__asm volatile("csrs mstatus, %0" ::"r"(s) : "memory");
	}

	static inline void wfi()
	{
		__asm volatile("wfi");
	}

} // namespace priv

#endif // _PRIV_RISCV_H_
