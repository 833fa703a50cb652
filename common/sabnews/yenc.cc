/*
	sabnews/yenc.cc
	---------------
*/

#include "sabnews/yenc.hh"

// Standard C
#include <stdio.h>

// sabnews
#include "sabnews/crc32.hh"
#include "sabnews/send_queue.hh"


#define STR_LEN( s )  "" s, (sizeof s - 1)


namespace sabnews
{
	
	using std::size_t;
	
	
	static inline
	bool must_escape( unsigned char c )
	{
		switch ( c )
		{
			case '\0':
			case '\n':
			case '\r':
			case '=':
			case '.':
				return true;
			
			default:
				return false;
		}
	}
	
	void queue_yenc_header( send_queue& queue, const yenc_part& part, size_t size )
	{
		char line[ 128 ];
		
		int n = snprintf( line, sizeof line,
		                  "=ybegin part=%llu line=%u size=%llu name=",
		                  (unsigned long long) part.part,
		                  yenc_line_length,
		                  (unsigned long long) part.file_size );
		
		queue.add( line, n );
		queue.add( part.name );
		queue.add( STR_LEN( "\r\n" ) );
		
		n = snprintf( line, sizeof line,
		              "=ypart begin=%llu end=%llu\r\n",
		              (unsigned long long) (part.start + 1),
		              (unsigned long long) (part.start + size) );
		
		queue.add( line, n );
	}
	
	/*
		The line counter is checked after every input byte and is never
		at the limit yet, so each encoded byte (or escape pair) ends up on
		a line of its own.  Existing clients parse exactly this layout.
	*/
	
	void queue_yenc_data( send_queue& queue, const char* data, size_t n )
	{
		unsigned line_size = 0;
		
		const unsigned char* p   = (const unsigned char*) data;
		const unsigned char* end = p + n;
		
		while ( p < end )
		{
			unsigned char c = *p++ + 42;
			
			if ( must_escape( c ) )
			{
				queue.add( STR_LEN( "=" ) );
				
				++line_size;
				
				c += 64;
			}
			
			queue.add( &c, 1 );
			
			++line_size;
			
			if ( line_size  &&  ! (line_size >= yenc_line_length) )
			{
				queue.add( STR_LEN( "\r\n" ) );
				
				line_size = 0;
			}
		}
	}
	
	void queue_yenc_footer( send_queue& queue, const yenc_part& part, const char* data, size_t n )
	{
		const uint32_t crc = part.crc == crc_payload ? payload_crc32( data, n )
		                                             : 0;
		
		char line[ 128 ];
		
		int length = snprintf( line, sizeof line,
		                       "=yend size=%llu part=%llu pcrc32=%08x\r\n",
		                       (unsigned long long) n,
		                       (unsigned long long) part.part,
		                       (unsigned) crc );
		
		queue.add( line, length );
	}
	
	void queue_yenc( send_queue& queue, const yenc_part& part, const char* data, size_t n )
	{
		queue_yenc_header( queue, part, n );
		queue_yenc_data  ( queue, data, n );
		queue_yenc_footer( queue, part, data, n );
	}
	
}
