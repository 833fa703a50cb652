/*
	sabnews/session.cc
	------------------
*/

#include "sabnews/session.hh"

// POSIX
#include <sys/socket.h>

// sabnews
#include "sabnews/response.hh"


namespace sabnews
{
	
	void session::connect()
	{
		send_greeting( its_queue );
		
		its_connected = true;
	}
	
	void session::disconnect()
	{
		send_closing( its_queue );
		
		its_connected = false;
		
		// Not a socket when serving stdio; the caller closes descriptors.
		shutdown( its_queue.fd(), SHUT_RDWR );
	}
	
}
