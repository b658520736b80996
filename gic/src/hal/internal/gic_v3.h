#pragma once

// Redistributor RD_base frame.
#define GICR_CTLR  0x0000
#define GICR_IIDR  0x0004
#define GICR_TYPER 0x0008
#define GICR_WAKER 0x0014

#define GICR_CTLR_RWP (1u << 3)

#define GICR_TYPER_LAST (1ull << 4)

#define GICR_WAKER_PROCESSOR_SLEEP (1u << 1)
#define GICR_WAKER_CHILDREN_ASLEEP (1u << 2)

// SGI_base frame, 64KiB after RD_base.
#define GICR_SGI_OFFSET 0x10000
#define GICR_IGROUPR0    (GICR_SGI_OFFSET + 0x0080)
#define GICR_ISENABLER0  (GICR_SGI_OFFSET + 0x0100)
#define GICR_ICENABLER0  (GICR_SGI_OFFSET + 0x0180)
#define GICR_ICPENDR0    (GICR_SGI_OFFSET + 0x0280)
#define GICR_ICACTIVER0  (GICR_SGI_OFFSET + 0x0380)
#define GICR_IPRIORITYR0 (GICR_SGI_OFFSET + 0x0400)
#define GICR_ICFGR0      (GICR_SGI_OFFSET + 0x0C00)
#define GICR_ICFGR1      (GICR_SGI_OFFSET + 0x0C04)

#define ICC_SRE_EL1_SRE     (1ull << 0)
#define ICC_IGRPEN1_EL1_ENABLE 1ull
#define ICC_IAR1_EL1_INTID  0xFFFFFF

#define ICC_SGI1R_INTID_SHIFT 24
#define ICC_SGI1R_AFF1_SHIFT  16
#define ICC_SGI1R_AFF2_SHIFT  32
#define ICC_SGI1R_AFF3_SHIFT  48
#define ICC_SGI1R_IRM         (1ull << 40)
