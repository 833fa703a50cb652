/*
	sabnews/crc32.cc
	----------------
*/

#include "sabnews/crc32.hh"

// zlib
#include <zlib.h>


namespace sabnews
{
	
	// zlib's length parameter is a uInt
	static const std::size_t max_chunk = 1u << 30;
	
	uint32_t payload_crc32( const void* data, std::size_t n )
	{
		const Bytef* p = (const Bytef*) data;
		
		uLong crc = ::crc32( 0L, Z_NULL, 0 );
		
		while ( n > 0 )
		{
			const uInt chunk = uInt( n < max_chunk ? n : max_chunk );
			
			crc = ::crc32( crc, p, chunk );
			
			p += chunk;
			n -= chunk;
		}
		
		return uint32_t( crc );
	}
	
}
