#pragma once

#include <stdio.h>      /* fprintf, flockfile */
#include <stdint.h>     /* [u]int*_t          */
#include <stdlib.h>     /* exit               */
#include <errno.h>      /* errno              */
#include <string.h>     /* strerror           */

/* compiler hints for branch prediciton */
#ifndef likely
#define likely(x)       __builtin_expect((x),1)
#endif

#ifndef unlikely
#define unlikely(x)     __builtin_expect((x),0)
#endif

/* `elif` keyword for brevity */
#ifndef elif
#define elif else if
#endif

/* set at runtime by --verbose; DEBUG output is suppressed otherwise */
inline uint8_t debug_en = 0;

#define RED         "\033[31m"
#define RED_B       "\033[31;1m"
#define GREEN       "\033[32m"
#define GREEN_B     "\033[32;1m"
#define YELLOW      "\033[33m"
#define YELLOW_B    "\033[33;1m"
#define BLUE        "\033[34m"
#define BLUE_B      "\033[34;1m"

#define UNSET_B     "\033[2m"
#define CLR         "\033[0m"

/* LOG_LINE - single line under the stdio lock (worker threads log too) */
#define LOG_LINE(color, tag, msg...)                                     \
    do {                                                                 \
        flockfile(stdout);                                               \
        fprintf(stdout, color "[" tag "] %s:%d ", __FILE__, __LINE__);   \
        fprintf(stdout, UNSET_B msg);                                    \
        fprintf(stdout, CLR "\n");                                       \
        funlockfile(stdout);                                             \
    } while (0)

/* [error] no assertion, just print */
#define ERROR(msg...) LOG_LINE(RED_B, "!", msg)

/* [error] on assertion, exit with -1 */
#define DIE(assertion, msg...) \
    do {                       \
        if (assertion) {       \
            ERROR(msg);        \
            exit(-1);          \
        }                      \
    } while(0)

/* [error] on assertion, jump to cleanup label */
#define GOTO(assertion, label, msg...) \
    do {                               \
        if (assertion) {               \
            ERROR(msg);                \
            goto label;                \
        }                              \
    } while (0)

/* [error] on assertion, immediately return */
#define RET(assertion, code, msg...) \
    do {                             \
        if (assertion) {             \
            ERROR(msg);              \
            return code;             \
        }                            \
    } while (0)

/* [warning] no assertion, just print */
#define WAR(msg...) LOG_LINE(YELLOW_B, "?", msg)

/* [warning] on assertion, carry on */
#define ALERT(assertion, msg...) \
    do {                         \
        if (assertion) {         \
            WAR(msg);            \
        }                        \
    } while (0)

/* [debug] no assertion, just print */
#define DEBUG(msg...)                    \
    do {                                 \
        if (debug_en)                    \
            LOG_LINE(BLUE_B, "-", msg);      \
    } while (0)

/* [info] no assertion, just print */
#define INFO(msg...) LOG_LINE(GREEN_B, "*", msg)
