#define ZDT_VERSION "1.0.0"
#define ZDT_VERNUM 0x010000
