#include "PodConfig.hpp"

#include "SimpleIni.h"

namespace tpod {
PodConfig::PodConfig() : silent(false), maxLogSize("20971520") {}

bool PodConfig::load(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    LOG(WARNING) << "Could not load config file " << path << ": " << rc;
    return false;
  }

  const char* shellPtr = ini.GetValue("Pod", "shell", NULL);
  if (shellPtr) {
    shell = trim(shellPtr);
  }
  const char* cwdPtr = ini.GetValue("Pod", "cwd", NULL);
  if (cwdPtr) {
    cwd = trim(cwdPtr);
  }
  const char* socketDirPtr = ini.GetValue("Pod", "socketdir", NULL);
  if (socketDirPtr) {
    socketDir = trim(socketDirPtr);
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verbose = atoi(vlevel);
  }
  // read silent setting
  const char* silentPtr = ini.GetValue("Debug", "silent", NULL);
  if (silentPtr && atoi(silentPtr) != 0) {
    silent = true;
  }
  // read log file size limit
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure maxlogsize is a string of int value
    maxLogSize = to_string(atoi(logsize));
  }
  return true;
}

string PodConfig::resolveShell(const string& cliShell) const {
  if (!cliShell.empty()) {
    return cliShell;
  }
  if (!shell.empty()) {
    return shell;
  }
  const char* envShell = getenv("SHELL");
  if (envShell && envShell[0]) {
    return string(envShell);
  }
  return "/bin/sh";
}
}  // namespace tpod
