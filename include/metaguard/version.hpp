#pragma once

#ifndef METAGUARD_VERSION
#define METAGUARD_VERSION "unknown"
#endif
#ifndef METAGUARD_COMMIT
#define METAGUARD_COMMIT "unknown"
#endif
