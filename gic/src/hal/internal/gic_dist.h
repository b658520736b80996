#pragma once

// Distributor registers (offsets from GICD base), common to GICv2 and GICv3.
#define GICD_CTLR       0x0000
#define GICD_TYPER      0x0004
#define GICD_IIDR       0x0008
#define GICD_IGROUPR    0x0080
#define GICD_ISENABLER  0x0100
#define GICD_ICENABLER  0x0180
#define GICD_ISPENDR    0x0200
#define GICD_ICPENDR    0x0280
#define GICD_ISACTIVER  0x0300
#define GICD_ICACTIVER  0x0380
#define GICD_IPRIORITYR 0x0400
#define GICD_ITARGETSR  0x0800  // GICv2 only
#define GICD_ICFGR      0x0C00
#define GICD_SGIR       0x0F00  // GICv2 only
#define GICD_IROUTER    0x6000  // GICv3 only, 64-bit per INTID

#define GICD_CTLR_ENABLE_GRP0 (1u << 0)
#define GICD_CTLR_ENABLE_GRP1 (1u << 1)
#define GICD_CTLR_ARE_NS      (1u << 4)
#define GICD_CTLR_RWP         (1u << 31)

#define GICD_TYPER_IT_LINES 0x1F

// ICFGR holds two bits per INTID; the upper one selects edge triggering.
#define GICD_ICFGR_EDGE 0x2

#define GICD_SGIR_TARGET_LIST   (0u << 24)
#define GICD_SGIR_TARGET_OTHERS (1u << 24)
#define GICD_SGIR_TARGET_SELF   (2u << 24)

// Uniform priority programmed for every INTID; priorities are not exposed.
#define GIC_DEFAULT_PRIORITY 0xA0
#define GIC_PRIORITY_MASK_ALL 0xFF

// Bounded spin for register-write-pending bits.
#define GIC_RWP_TIMEOUT 1000000
