/*
	sabnews/receiver.cc
	-------------------
*/

#include "sabnews/receiver.hh"

// Standard C
#include <string.h>


namespace sabnews
{
	
	using std::size_t;
	
	
	line_receiver::line_receiver( line_handler_function handler, void* context )
	:
		its_handler( handler ),
		its_context( context )
	{
	}
	
	int line_receiver::recv_bytes( const char* buffer, size_t n )
	{
		its_buffer.append( buffer, n );
		
		const char* data = its_buffer.data();
		size_t data_size = its_buffer.size();
		
		const char* p = data;
		
		int status = 0;
		
		while ( data_size > 0 )
		{
			const char* lf = (const char*) memchr( p, '\n', data_size );
			
			if ( lf == NULL )
			{
				break;
			}
			
			const size_t line_size = lf + 1 - p;
			
			status = its_handler( its_context, p, line_size );
			
			data_size -= line_size;
			p         += line_size;
			
			if ( status != 0 )
			{
				break;
			}
		}
		
		if ( p != data )
		{
			its_buffer.assign( p, data_size );
		}
		
		return status;
	}
	
}
