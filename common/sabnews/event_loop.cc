/*
	sabnews/event_loop.cc
	---------------------
*/

#include "sabnews/event_loop.hh"

// POSIX
#include <unistd.h>

// Standard C
#include <errno.h>

// sabnews
#include "sabnews/receiver.hh"


namespace sabnews
{
	
	int run_event_loop( line_receiver& r, int fd )
	{
		for ( ;; )
		{
			char buffer[ 4096 ];
			
			const ssize_t n_read = read( fd, &buffer, sizeof buffer );
			
			if ( n_read > 0 )
			{
				const int status = r.recv_bytes( buffer, n_read );
				
				if ( status != 0 )
				{
					return status < 0 ? status : 0;
				}
			}
			else if ( n_read == 0 )
			{
				return 0;
			}
			else if ( errno != EINTR )
			{
				return -errno;
			}
		}
	}
	
}
