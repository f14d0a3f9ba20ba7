#ifndef GEPCONFIG_H_
#define GEPCONFIG_H_

/** semantic versioning */
#define GEP_VERSION_MAJOR 0
#define GEP_VERSION_MINOR 1
#define GEP_VERSION_PATCH 0

#include <stdio.h>

inline void show_copyright()
{
    char msg[1024];
    sprintf(msg, "\n=================================================================================\n"
                 "  GEP: Benders decomposition for generation expansion planning\n"
                 "  - Version %d.%d.%d\n"
                 "=================================================================================\n",
            GEP_VERSION_MAJOR, GEP_VERSION_MINOR, GEP_VERSION_PATCH);
    printf("%s", msg);
}

#endif
