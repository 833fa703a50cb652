/*
	sabnews/event_loop.hh
	---------------------
*/

#ifndef SABNEWS_EVENTLOOP_HH
#define SABNEWS_EVENTLOOP_HH


namespace sabnews
{
	
	class line_receiver;
	
	/*
		Returns 0 at end of input or when the handler ends the session,
		-errno on a read error or a handler failure.
	*/
	
	int run_event_loop( line_receiver& r, int fd );
	
}

#endif
