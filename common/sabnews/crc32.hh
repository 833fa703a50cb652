/*
	sabnews/crc32.hh
	----------------
*/

#ifndef SABNEWS_CRC32_HH
#define SABNEWS_CRC32_HH

// Standard C
#include <stdint.h>

// Standard C++
#include <cstddef>


namespace sabnews
{
	
	uint32_t payload_crc32( const void* data, std::size_t n );
	
}

#endif
