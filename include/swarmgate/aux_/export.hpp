/*

Copyright (c) 2026, the swarmgate authors
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions
are met:

    * Redistributions of source code must retain the above copyright
      notice, this list of conditions and the following disclaimer.
    * Redistributions in binary form must reproduce the above copyright
      notice, this list of conditions and the following disclaimer in
      the documentation and/or other materials provided with the distribution.
    * Neither the name of the author nor the names of its
      contributors may be used to endorse or promote products derived
      from this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE
LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
POSSIBILITY OF SUCH DAMAGE.

*/

#ifndef SWARMGATE_EXPORT_HPP_INCLUDED
#define SWARMGATE_EXPORT_HPP_INCLUDED

#include <boost/config.hpp>

// when building swarmgate as a shared library, SWARMGATE_BUILDING_SHARED
// is defined. Clients linking against the shared library define
// SWARMGATE_LINKING_SHARED
#if defined SWARMGATE_BUILDING_SHARED
# define SWARMGATE_EXPORT BOOST_SYMBOL_EXPORT
#elif defined SWARMGATE_LINKING_SHARED
# define SWARMGATE_EXPORT BOOST_SYMBOL_IMPORT
#endif

// SWARMGATE_EXTRA_EXPORT marks internal symbols that the unit tests
// still need to reach
#if defined SWARMGATE_EXPORT_EXTRA
# if defined SWARMGATE_BUILDING_SHARED
#  define SWARMGATE_EXTRA_EXPORT BOOST_SYMBOL_EXPORT
# elif defined SWARMGATE_LINKING_SHARED
#  define SWARMGATE_EXTRA_EXPORT BOOST_SYMBOL_IMPORT
# endif
#endif

#ifndef SWARMGATE_EXPORT
# define SWARMGATE_EXPORT
#endif

#ifndef SWARMGATE_EXTRA_EXPORT
# define SWARMGATE_EXTRA_EXPORT
#endif

#endif // SWARMGATE_EXPORT_HPP_INCLUDED
