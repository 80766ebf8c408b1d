/**
* @file   types.h
* @brief  Core types for the wsforge library
*/

#ifndef WSFORGE_TYPES_H
#define WSFORGE_TYPES_H

#include <stddef.h>

typedef signed int wsforge_int_t; /**< Signed double word type */
typedef size_t wsforge_size_t; /**< Size type */

#endif
