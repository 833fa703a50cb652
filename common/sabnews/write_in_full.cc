/*
	sabnews/write_in_full.cc
	------------------------
*/

#include "sabnews/write_in_full.hh"

// POSIX
#include <errno.h>
#include <poll.h>
#include <unistd.h>

// poseven
#include "poseven/types/errno_t.hh"


namespace sabnews
{
	
	namespace p7 = poseven;
	
	
	static void wait_until_writable( int fd )
	{
		struct pollfd pfd = { fd, POLLOUT, 0 };
		
		int polled = poll( &pfd, 1, -1 );
		
		if ( polled < 0  &&  errno != EINTR )
		{
			p7::throw_errno( errno );
		}
	}
	
	void write_in_full( int fd, const void* buffer, size_t n )
	{
		const char* p = (const char*) buffer;
		
		while ( n > 0 )
		{
			ssize_t n_written = write( fd, p, n );
			
			if ( n_written >= 0 )
			{
				n -= n_written;
				p += n_written;
			}
			else if ( errno == EAGAIN  ||  errno == EWOULDBLOCK )
			{
				wait_until_writable( fd );
			}
			else if ( errno != EINTR )
			{
				p7::throw_errno( errno );
			}
		}
	}
	
}
