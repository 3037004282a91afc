#pragma once

// Common path
#define EVENTFACE_ROOT							"/opt/eventface/"
#define EVENTFACE_ASSET							EVENTFACE_ROOT "assets/"

// Face models
#define YNMODEL_PATH							EVENTFACE_ASSET "models/face/"
#define YNMODEL									"face_detection_yunet_2023mar.onnx"

#define RECOGNIZER_PATH							EVENTFACE_ASSET "models/face/"
#define RECOGNIZER								"arcface_w600k_r50.onnx"

// Sqlite DB
#define DB_PATH									EVENTFACE_ROOT "db/"
#define DB										"eventface.db"

// Config
#define CONFIG_PATH								EVENTFACE_ROOT "etc/"
#define CONFIG									"eventface.ini"
