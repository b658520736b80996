#pragma once

// CPU interface registers (offsets from GICC base).
#define GICC_CTLR 0x0000
#define GICC_PMR  0x0004
#define GICC_BPR  0x0008
#define GICC_IAR  0x000C
#define GICC_EOIR 0x0010
#define GICC_RPR  0x0014

#define GICC_CTLR_ENABLE 0x1

#define GICC_IAR_INTID      0x3FF
#define GICC_IAR_CPUID_SHIFT 10
#define GICC_IAR_CPUID      0x7
