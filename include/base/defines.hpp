#ifndef _BASE_DEFINES_H_
#define _BASE_DEFINES_H_

#include <cassert>
#include <cstddef>
#include <cstdint>

#ifndef QUICKFILTER_CPP_EXPORT
#define QUICKFILTER_CPP_EXPORT
#endif

#define DISALLOW_COPY_AND_ASSIGN(TypeName)  \
    TypeName(const TypeName&) = delete;     \
    TypeName& operator=(const TypeName&) = delete

// QUICKFILTER_NOTREACHED
#define QUICKFILTER_NOTREACHED() \
    assert(false && "NOT REACHED")

#endif
