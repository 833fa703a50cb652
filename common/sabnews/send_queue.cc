/*
	sabnews/send_queue.cc
	---------------------
*/

#include "sabnews/send_queue.hh"

// more-libc
#include "more/string.h"

// sabnews
#include "sabnews/write_in_full.hh"


namespace sabnews
{
	
	inline
	void buffer::append_UNCHECKED( const void* data, size_t n )
	{
		mempcpy( its_buffer + its_mark, data, n );
		
		its_mark += n;
	}
	
	void send_queue::flush()
	{
		if ( its_buffer.size() == 0 )
		{
			return;
		}
		
		// A failed write drops the pending bytes.
		
		const size_t n = its_buffer.size();
		
		its_buffer.clear();
		
		write_in_full( its_fd, its_buffer.data(), n );
	}
	
	void send_queue::add( const void* data, size_t n )
	{
		if ( n > its_buffer.freespace() )
		{
			flush();
			
			if ( n > its_buffer.capacity() )
			{
				write_in_full( its_fd, data, n );
				
				return;
			}
		}
		
		its_buffer.append_UNCHECKED( data, n );
	}
	
}
