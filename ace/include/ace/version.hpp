#pragma once

#define ACE_VERSION "1.4.0"
#define ACE_PLAYBOOK_FORMAT 1
